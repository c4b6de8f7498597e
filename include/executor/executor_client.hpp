#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "problem/problem.hpp"
#include "toolchain/toolchain.hpp"

namespace arbiter::executor {

enum class job_kind {
    COMPILE,
    RUN_TEST
};

/**
 * @brief 提交给执行器的一个任务
 * 每个任务都有唯一的 id，重试时会创建新的任务
 */
struct job_handle {
    std::string id;

    job_kind kind = job_kind::COMPILE;

    /**
     * @brief 对于 RUN_TEST，表示评测的测试点下标
     */
    std::size_t test_index = 0;
};

/**
 * @brief 编译产物
 */
struct compiled_artifact {
    std::string binary;
};

/**
 * @brief 一个测试点的运行数据
 */
struct test_input {
    std::size_t index = 0;

    std::filesystem::path input;

    std::optional<std::filesystem::path> answer;

    checker_spec checker;
};

/**
 * @brief 执行器返回的任务结果
 * 沙箱限制的超时、内存超限都会作为正常结果返回，而不是异常
 */
struct run_outcome {
    /**
     * @brief 对于编译任务，只会是 ACCEPTED 或者 COMPILE_ERROR
     */
    status verdict = status::JUDGE_FAULT;

    /**
     * @brief CPU 时间，单位为毫秒
     */
    uint64_t time = 0;

    /**
     * @brief 内存使用，单位为字节
     */
    uint64_t memory = 0;

    /**
     * @brief 选手程序的 stdout 和 stderr
     */
    std::string output;
    std::string error_output;

    /**
     * @brief 比较器的输出
     */
    std::string checker_log;

    /**
     * @brief 编译器输出，按编译步骤拼接
     */
    std::string compile_log;

    /**
     * @brief 编译成功时的编译产物
     */
    std::optional<compiled_artifact> artifact;
};

/**
 * @brief 远程沙箱执行服务的客户端
 * 任务的提交是异步的：submit_* 立即返回任务句柄，await_result 等待结果。
 * 客户端不会自动重试，重试策略由评测流水线决定。
 * 实现必须是线程安全的，同一个提交的多个测试点会在多个线程中同时提交。
 */
struct executor_client {
    virtual ~executor_client();

    /**
     * @brief 提交编译任务
     * @throw infrastructure_error 无法提交
     */
    virtual job_handle submit_compile(const toolchain &tc, const std::string &source) = 0;

    /**
     * @brief 提交测试点运行任务，运行后执行比较器
     * @throw infrastructure_error 无法提交
     */
    virtual job_handle submit_run(const toolchain &tc, const compiled_artifact &artifact, const test_input &input, const resource_limits &limits) = 0;

    /**
     * @brief 等待任务结束
     * 这个函数总会返回：要么返回任务结果，要么抛出异常，不会无限阻塞
     * @param deadline 调用方的截止时间
     * @throw infrastructure_error 执行器无法完成任务
     * @throw deadline_exceeded 截止时间前任务没有完成，任务仍然在执行，调用方可以取消
     * @throw job_cancelled 等待过程中任务被 cancel
     */
    virtual run_outcome await_result(const job_handle &handle, std::chrono::steady_clock::time_point deadline) = 0;

    /**
     * @brief 尽力取消任务，执行器可能仍然会完成任务，结果将被丢弃
     * 正在 await_result 的线程会被唤醒
     */
    virtual void cancel(const job_handle &handle) = 0;
};

}  // namespace arbiter::executor
