#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "valuer/valuer.hpp"

namespace arbiter {

/**
 * @brief 评测流水线的状态
 * QUEUED -> COMPILING -> {COMPILE_FAILED | JUDGING} -> {SCORED | FAULTED}
 * 任意非终止状态都可能直接进入 FAULTED
 */
enum class pipeline_state {
    QUEUED,
    COMPILING,
    COMPILE_FAILED,  // 终止状态
    JUDGING,
    SCORED,   // 终止状态
    FAULTED   // 终止状态
};

const char *get_pipeline_state_name(pipeline_state);

bool is_terminal(pipeline_state);

/**
 * @brief 提交进入 FAULTED 的原因
 */
enum class fault_reason {
    NONE,
    PROBLEM_UNAVAILABLE,     // 题目包不存在或者损坏
    TOOLCHAIN_UNAVAILABLE,   // 工具链不存在
    COMPILE_INFRASTRUCTURE,  // 编译任务重试次数用完
    DEADLINE_EXCEEDED,       // 整个提交的评测时间超出预算
    INVARIANT_VIOLATION,     // 评测系统 bug
    INTERNAL_ERROR,
    SERVICE_STOPPED          // 评测服务停止时提交还没有被评测
};

const char *get_fault_reason_name(fault_reason);

enum class test_disposition {
    EXECUTED,  // 已经评测
    SKIPPED,   // 因为依赖的测试组没有通过而跳过
    NOT_RUN    // valuer 没有请求评测
};

const char *get_test_disposition_name(test_disposition);

/**
 * @brief 一个测试点的评测记录
 */
struct test_trace {
    std::size_t index = 0;

    test_disposition disposition = test_disposition::NOT_RUN;

    /**
     * @brief 只有 EXECUTED 的测试点有结果
     */
    std::optional<test_outcome> outcome;
};

/**
 * @brief 一个提交的最终评测结果，每个提交恰好产生一个
 */
struct judge_result {
    std::string submission_id;

    pipeline_state state = pipeline_state::QUEUED;

    status verdict = status::JUDGE_FAULT;

    fault_reason reason = fault_reason::NONE;

    /**
     * @brief 人类可读的说明，比如出错原因
     */
    std::string message;

    /**
     * @brief 只有 SCORED 的提交有分数
     */
    std::optional<arbiter::score> final_score;

    std::string compile_log;

    /**
     * @brief 按测试点下标排序的评测记录，包含题目的所有测试点
     */
    std::vector<test_trace> tests;
};

void to_json(nlohmann::json &j, const test_outcome &outcome);

void to_json(nlohmann::json &j, const score &s);

void to_json(nlohmann::json &j, const judge_result &result);

}  // namespace arbiter
