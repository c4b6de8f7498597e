#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "judge/pipeline.hpp"

namespace arbiter {

/**
 * @brief 评测系统的配置
 * 可以从 JSON 配置文件读取，再由命令行参数、环境变量覆盖
 *
 * {
 *     "problems_dir": "/var/lib/arbiter/problems",
 *     "toolchains_dir": "/var/lib/arbiter/toolchains",
 *     "executor": "http://localhost:8000",
 *     "checker_logs_dir": "/var/log/arbiter/checker",
 *     "max_parallel_tests": 4,
 *     "max_judging": 2,
 *     "retry": { "attempts": 3, "initial_backoff_ms": 100, "max_backoff_ms": 2000, "multiplier": 2 },
 *     "deadline_ms": 300000,
 *     "executor_timeout_ms": 60000
 * }
 */
struct judge_settings {
    /**
     * @brief 题目包文件夹，可以通过环境变量 PROBLEMSDIR 指定
     */
    std::filesystem::path problems_dir;

    /**
     * @brief 工具链文件夹，可以通过环境变量 TOOLCHAINSDIR 指定
     */
    std::filesystem::path toolchains_dir;

    /**
     * @brief 执行器地址，可以通过环境变量 EXECUTOR 指定
     */
    std::string executor_address = "http://localhost:8000";

    std::optional<std::filesystem::path> checker_logs_dir;

    /**
     * @brief 一个提交同时评测的测试点数上限
     */
    std::size_t max_parallel_tests = 4;

    /**
     * @brief 同时评测的提交数上限，超出的提交在队列中等待
     */
    std::size_t max_judging = 2;

    retry_policy retry;

    /**
     * @brief 一个提交的评测时间预算
     */
    std::chrono::milliseconds deadline{std::chrono::minutes(5)};

    /**
     * @brief 单个执行器 HTTP 请求的超时时间
     */
    std::chrono::milliseconds executor_timeout{std::chrono::minutes(1)};

    pipeline_settings get_pipeline_settings() const;
};

void from_json(const nlohmann::json &j, judge_settings &settings);

}  // namespace arbiter
