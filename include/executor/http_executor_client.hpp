#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "executor/executor_client.hpp"
#include "executor/invoke_request.hpp"

namespace arbiter::executor {

/**
 * @brief 通过 HTTP 访问远程执行器的客户端
 * 每个任务是一次 POST {address}/exec 请求，请求在单独的线程中阻塞执行。
 * 取消任务时中断正在进行的请求，并尽力通知执行器 DELETE {address}/exec/{id}。
 */
struct http_executor_client : public executor_client {
    /**
     * @param address 执行器地址，比如 http://localhost:8000
     * @param request_timeout 单个 HTTP 请求的超时时间
     */
    http_executor_client(const std::string &address, std::chrono::milliseconds request_timeout);
    ~http_executor_client() override;

    job_handle submit_compile(const toolchain &tc, const std::string &source) override;

    job_handle submit_run(const toolchain &tc, const compiled_artifact &artifact, const test_input &input, const resource_limits &limits) override;

    run_outcome await_result(const job_handle &handle, std::chrono::steady_clock::time_point deadline) override;

    void cancel(const job_handle &handle) override;

private:
    struct job {
        std::shared_ptr<std::atomic<bool>> cancelled;
        std::shared_future<run_outcome> result;
    };

    std::string address;
    std::chrono::milliseconds request_timeout;

    std::mutex mut;
    std::map<std::string, job> jobs;

    // 被取消的任务可能仍然在阻塞请求，析构时等待它们结束
    std::vector<std::shared_future<run_outcome>> abandoned;

    job_handle start_job(job_kind kind, std::size_t test_index, std::function<run_outcome(const std::string &, const std::atomic<bool> &)> task);

    void reap_abandoned();

    /**
     * @brief 发送请求并返回响应体
     * @throw infrastructure_error 网络错误或者执行器返回非 2xx 状态码
     */
    nlohmann::json post(const nlohmann::json &body, const std::atomic<bool> &cancelled) const;

    void send_cancel(const std::string &id) const;
};

}  // namespace arbiter::executor
