#pragma once

#include <string>
#include <vector>
#include "judge/judge_result.hpp"
#include "judge/submission.hpp"
#include "valuer/valuer.hpp"

namespace arbiter {

/**
 * @brief 评测 worker 的状态
 */
enum class worker_state {
    START,    // worker 启动
    JUDGING,  // worker 正在评测提交
    IDLE,     // worker 空闲
    STOPPED,  // worker 正常退出
    CRASHED   // worker 崩溃
};

/**
 * @brief 执行监控行为
 * 所有函数默认什么都不做，监控器只需要覆盖关心的事件。
 * 同一个监控器会被多个评测线程同时调用，实现必须是线程安全的。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前已经开始评测一个提交
     */
    virtual void start_submission(const submission &submit);

    /**
     * @brief 监控上报提交的评测流水线状态发生变化
     */
    virtual void state_changed(const submission &submit, pipeline_state state);

    /**
     * @brief 监控上报当前已经开始评测某个测试点（实时测试点）
     * @param attempt 第几次尝试，从 1 开始
     */
    virtual void start_test(const submission &submit, std::size_t test_index, unsigned attempt);

    /**
     * @brief 监控上报某个测试点已经评测结束
     */
    virtual void end_test(const submission &submit, std::size_t test_index, const test_outcome &outcome);

    /**
     * @brief 监控上报 valuer 请求的一批测试点已经全部评测完成
     * @param requested valuer 请求的测试点
     * @param outcomes 交给 valuer 的结果
     */
    virtual void batch_finished(const submission &submit, const std::vector<std::size_t> &requested, const outcome_map &outcomes);

    /**
     * @brief 监控上报当前的实时分数
     */
    virtual void live_score(const submission &submit, const score &current);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 监控上报评测系统内部错误，需要运维人员关注
     */
    virtual void report_error(const std::string &message);

    /**
     * @brief 监控上报当前已经完成一个提交的评测
     * @param result 提交的最终评测结果
     */
    virtual void end_submission(const submission &submit, const judge_result &result);
};

}  // namespace arbiter
