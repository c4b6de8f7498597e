#pragma once

#include <chrono>

namespace arbiter {

/**
 * @brief 执行器基础设施错误的重试策略
 * 对每个任务（编译或者单个测试点）单独计数，而不是整个提交
 */
struct retry_policy {
    /**
     * @brief 最多尝试次数（包括第一次），至少为 1
     */
    unsigned max_attempts = 3;

    std::chrono::milliseconds initial_backoff{100};

    std::chrono::milliseconds max_backoff{2000};

    double multiplier = 2;

    /**
     * @brief 第 attempt 次尝试失败后等待的时间（attempt 从 1 开始）
     * initial_backoff * multiplier^(attempt-1)，不超过 max_backoff
     */
    std::chrono::milliseconds backoff(unsigned attempt) const;
};

}  // namespace arbiter
