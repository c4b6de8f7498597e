#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/pipeline.hpp"
#include "monitor/monitor.hpp"

/**
 * 评测服务
 * 评测请求进入队列后由固定数量的 worker 线程评测，worker 数量即同时处于评测中的
 * 提交数上限，超出的提交在队列中保持 QUEUED 状态。
 *
 * 每个 worker 循环从队列中取出提交，为提交创建独立的评测流水线，评测完成后
 * 保存评测结果并唤醒等待者。
 */
namespace arbiter::server {

struct judge_service {
    /**
     * @param workers 同时评测的提交数上限，至少为 1
     */
    judge_service(problem_repository &problems,
                  toolchain_repository &toolchains,
                  executor::executor_client &executor,
                  pipeline_settings settings,
                  std::size_t workers);

    ~judge_service();

    /**
     * @brief 注册监控器
     * 必须在 start 之前注册
     */
    void register_monitor(std::unique_ptr<monitor> &&m);

    /**
     * @brief 启动评测 worker 线程
     */
    void start();

    /**
     * @brief 提交评测请求
     * @param submit 如果 submit.id 为空，则生成一个随机 id
     * @return 提交 id
     * @throw std::invalid_argument 提交 id 重复
     * @throw std::logic_error 评测服务已经停止
     */
    std::string enqueue(submission submit);

    /**
     * @brief 获取提交当前的评测状态
     * @throw std::out_of_range 提交不存在
     */
    pipeline_state status(const std::string &id) const;

    /**
     * @brief 阻塞等待提交评测完成
     * 评测结果被所有等待者取走后从评测服务中删除，之后 status 和 wait 都会抛出 out_of_range
     * @throw std::out_of_range 提交不存在
     */
    judge_result wait(const std::string &id);

    /**
     * @brief 标记评测服务停止，不等待 worker 退出，可以在信号处理函数中调用
     * 调用后不再接受新的提交，worker 在队列为空时退出。已经在队列中的提交仍然会被评测。
     */
    void request_stop();

    /**
     * @brief 停止评测服务，并等待所有 worker 退出
     * 没有被评测的提交（比如 start 没有被调用）以 SERVICE_STOPPED 结束
     */
    void stop();

private:
    struct job {
        submission submit;
        pipeline_state state = pipeline_state::QUEUED;
        std::optional<judge_result> result;

        /**
         * @brief 正在 wait 的线程数
         */
        int waiters = 0;
    };

    /**
     * @brief 记录每个提交的流水线状态
     */
    struct state_tracker : public monitor {
        explicit state_tracker(judge_service &service);
        void state_changed(const submission &submit, pipeline_state state) override;

    private:
        judge_service &service;
    };

    problem_repository &problems;
    toolchain_repository &toolchains;
    executor::executor_client &executor;
    pipeline_settings settings;
    std::size_t worker_count;

    concurrent_queue<std::string> queue;
    std::atomic<bool> stopping{false};
    std::vector<std::thread> workers;

    mutable std::mutex mut;
    std::condition_variable job_finished;
    std::map<std::string, job> jobs;

    state_tracker tracker;
    std::vector<std::unique_ptr<monitor>> monitors;

    void worker_loop(int worker_id);

    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);
};

}  // namespace arbiter::server
