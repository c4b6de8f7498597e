#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 题目包不存在
 */
struct problem_not_found : public judge_exception {
    explicit problem_not_found(const std::string &problem_id);
};

/**
 * @brief 题目包存在，但是 manifest 缺失必要字段或者互相矛盾
 */
struct problem_corrupt : public judge_exception {
    problem_corrupt(const std::string &problem_id, const std::string &reason);
};

struct toolchain_not_found : public judge_exception {
    toolchain_not_found(const std::string &toolchain_id, const std::string &reason);
};

/**
 * @brief 表示执行器自身无法完成任务
 * 比如网络错误、执行器过载、沙箱内部错误。这种错误不能被当成选手的错误，
 * 由评测流水线决定是否重试。
 */
struct infrastructure_error : public judge_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 整个提交的评测时间预算已经用完
 */
struct deadline_exceeded : public judge_exception {
    deadline_exceeded();
    explicit deadline_exceeded(const std::string &message);
};

/**
 * @brief 任务已经被调用方取消，等待结果的线程不再等待
 */
struct job_cancelled : public judge_exception {
    explicit job_cancelled(const std::string &job_id);
};

/**
 * @brief 评测系统内部的不变量被破坏，一定是 bug
 * 比如 valuer 请求评测一个已经评测过的测试点
 */
struct invariant_violation : public judge_exception {
    explicit invariant_violation(const std::string &message);
};

}  // namespace arbiter
