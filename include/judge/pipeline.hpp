#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "executor/executor_client.hpp"
#include "judge/judge_result.hpp"
#include "judge/retry_policy.hpp"
#include "judge/submission.hpp"
#include "monitor/monitor.hpp"
#include "problem/problem_repository.hpp"
#include "toolchain/toolchain_repository.hpp"
#include "valuer/valuer.hpp"

namespace arbiter {

struct pipeline_settings {
    /**
     * @brief 一个提交同时评测的测试点数上限
     */
    std::size_t max_parallel_tests = 4;

    retry_policy retry;

    /**
     * @brief 整个提交的评测时间预算（墙上时间），从 run 开始计时
     */
    std::chrono::milliseconds deadline{std::chrono::minutes(5)};

    /**
     * @brief 比较器日志的保存文件夹，为空时不保存
     * 保存路径为 ${checker_logs_dir}/${submission_id}/${test_index}
     */
    std::optional<std::filesystem::path> checker_logs_dir;
};

/**
 * @brief 一个提交的评测流水线
 * 流水线独占提交的状态机和 valuer，题目包和工具链通过仓库共享。
 *
 * 1. 加载题目包、工具链，失败时直接 FAULTED，不访问执行器
 * 2. 提交编译任务，编译错误时 COMPILE_FAILED，不评测任何测试点
 * 3. 向 valuer 询问需要评测的测试点，并发评测一批测试点，
 *    全部完成后一次性交给 valuer，直到 valuer 给出最终分数
 *
 * 执行器的基础设施错误按任务单独重试；编译任务重试用完则 FAULTED，
 * 测试点重试用完则该测试点记为 JUDGE_FAULT 交给 valuer。
 * 超出截止时间时取消所有执行中的任务并 FAULTED。
 * run 不会抛出异常，所有错误都转换为带有 fault_reason 的终止状态。
 */
struct judge_pipeline {
    judge_pipeline(submission submit,
                   problem_repository &problems,
                   toolchain_repository &toolchains,
                   executor::executor_client &executor,
                   pipeline_settings settings,
                   std::vector<monitor *> monitors = {});

    /**
     * @brief 评测提交，只能调用一次
     */
    judge_result run();

    pipeline_state state() const;

private:
    submission submit;
    problem_repository &problems;
    toolchain_repository &toolchains;
    executor::executor_client &executor;
    pipeline_settings settings;
    std::vector<monitor *> monitors;

    std::atomic<pipeline_state> current_state{pipeline_state::QUEUED};
    std::chrono::steady_clock::time_point deadline;

    std::mutex in_flight_mut;
    std::map<std::string, executor::job_handle> in_flight;

    /**
     * @brief cancel_in_flight 之后不再提交新的任务
     */
    bool cancelled = false;
    std::condition_variable cancel_signal;

    void transition(pipeline_state state);

    void call_monitor(const std::function<void(monitor &)> &callback);

    /**
     * @brief 提交任务并等待结果，基础设施错误时按照重试策略重试
     * @param submit_job 提交一次任务，第几次尝试作为参数
     * @throw infrastructure_error 重试次数用完
     * @throw deadline_exceeded 超出截止时间
     * @throw job_cancelled 任务被 cancel_in_flight 取消
     */
    executor::run_outcome execute_with_retry(const std::function<executor::job_handle(unsigned)> &submit_job);

    /**
     * @brief 编译选手代码
     * @throw infrastructure_error 编译任务重试次数用完
     */
    executor::run_outcome compile(const toolchain &tc);

    /**
     * @brief 评测一个测试点，重试次数用完时返回 JUDGE_FAULT
     */
    test_outcome run_test(const problem &prob, const toolchain &tc, const executor::compiled_artifact &artifact, std::size_t index);

    /**
     * @brief 最多 max_parallel_tests 个线程并发评测一批测试点，全部完成后返回
     * 任何一个测试点出错时立即取消这批测试点中所有执行中的任务
     * @throw deadline_exceeded 超出截止时间，所有执行中的任务都已经取消
     */
    outcome_map run_batch(const problem &prob, const toolchain &tc, const executor::compiled_artifact &artifact, const std::vector<std::size_t> &indices);

    void save_checker_log(std::size_t index, const std::string &log);

    /**
     * @brief 取消所有执行中的任务，之后不再提交新的任务
     */
    void cancel_in_flight();

    void fault(judge_result &result, fault_reason reason, const std::string &message);
};

}  // namespace arbiter
