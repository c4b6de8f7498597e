#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "common/status.hpp"
#include "problem/problem.hpp"

/**
 * 评分协议
 * valuer 决定评测哪些测试点，以及如何根据测试点结果计算分数。
 * valuer 是一个纯粹的决策过程：评测流水线把一批测试点的结果交给 valuer，
 * valuer 返回下一批要评测的测试点，或者给出最终分数。valuer 不会访问执行器。
 *
 * 状态：INIT -> WAITING_FOR_OUTCOMES -> ... -> FINISHED
 */
namespace arbiter {

/**
 * @brief 一个已经评测的测试点的结果
 */
struct test_outcome {
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
     * @brief 执行器捕获的选手程序 stdout 和 stderr，valuer 不使用
     */
    std::string output;
    std::string error_output;
};

/**
 * @brief 测试点下标到测试点结果的映射
 */
typedef std::map<std::size_t, test_outcome> outcome_map;

struct group_score {
    std::string name;
    uint32_t points = 0;
    uint32_t max_points = 0;

    /**
     * @brief 测试组是否因为依赖的测试组没有通过而被跳过
     */
    bool skipped = false;
};

struct score {
    /**
     * @brief 是否通过（总结果为 ACCEPTED）
     */
    bool passed = false;

    uint32_t points = 0;

    uint32_t max_points = 0;

    std::vector<group_score> groups;
};

/**
 * @brief valuer 请求评测一批测试点
 * 这批测试点可以并发评测，但是所有结果必须一起交给 valuer
 */
struct run_tests {
    std::vector<std::size_t> indices;
};

/**
 * @brief valuer 完成评分
 */
struct finish {
    score result;
    status verdict = status::ACCEPTED;
};

typedef std::variant<run_tests, finish> valuer_action;

enum class valuer_phase {
    INIT,
    WAITING_FOR_OUTCOMES,
    FINISHED
};

/**
 * @brief valuer 的决策依据，由 valuer_engine 维护
 */
struct valuer_context {
    const problem &prob;

    /**
     * @brief 已经评测完成的测试点
     */
    outcome_map resolved;

    /**
     * @brief 因为依赖没有通过而跳过的测试点
     */
    std::set<std::size_t> skipped;

    /**
     * @brief 被跳过的测试组在 valuer.groups 中的下标
     */
    std::set<std::size_t> skipped_groups;
};

/**
 * @brief 一次性评测所有测试点，按照测试组计分
 */
struct simple_sum_valuer {
    valuer_action next(valuer_context &ctx);
};

/**
 * @brief 按照下标顺序逐个评测，遇到第一个没有通过的测试点立即结束
 * 只有所有测试点都通过才能获得分数
 */
struct stop_on_first_failure_valuer {
    valuer_action next(valuer_context &ctx);
};

/**
 * @brief 按照测试组的依赖关系评测
 * 一个测试组的所有依赖都评测完成（或者被跳过）后，这个测试组才会开始评测。
 * 如果测试组是 dependent 的，而某个依赖没有通过，那么整个测试组被跳过，
 * 跳过的测试组也视为没有通过，因此跳过会沿依赖关系传递。
 * 同一时刻所有可以开始的测试组的测试点作为一批一起评测。
 */
struct grouped_valuer {
    valuer_action next(valuer_context &ctx);

private:
    std::set<std::size_t> started_groups;
};

typedef std::variant<simple_sum_valuer, stop_on_first_failure_valuer, grouped_valuer> valuer_strategy;

/**
 * @brief 根据题目的评分模式选择 valuer
 */
valuer_strategy make_valuer_strategy(scoring_mode mode);

/**
 * @brief 根据已经评测的测试点计算各测试组的分数
 * EACH 计分的测试组按照通过的比例向下取整，COMPLETE 计分的测试组全部通过才得分，
 * 没有测试点的测试组视为通过，被跳过的测试组不得分
 */
score compute_score(const valuer_context &ctx);

/**
 * @brief 计算总结果：选手错误中最严重的一个；没有选手错误时如果有 JUDGE_FAULT 则为
 * JUDGE_FAULT，否则为 ACCEPTED
 */
status classify(const outcome_map &resolved);

/**
 * @brief 一个提交的 valuer 实例，检查评分协议的不变量
 * 每个提交独占一个 valuer_engine，评测结束后丢弃。
 */
struct valuer_engine {
    explicit valuer_engine(const problem &prob);

    /**
     * @brief 给出第一个决定
     * @throw invariant_violation 已经开始过，或者 valuer 给出了不合法的请求
     */
    valuer_action begin();

    /**
     * @brief 提交上一批测试点的结果，获得下一个决定
     * @param outcomes 必须恰好包含上一次 run_tests 请求的所有测试点
     * @throw invariant_violation 结果不完整、包含没有请求的测试点、valuer 已经结束，
     * 或者 valuer 请求了不存在或已经评测过的测试点
     */
    valuer_action next(const outcome_map &outcomes);

    valuer_phase phase() const;

    /**
     * @brief 当前等待结果的测试点
     */
    const std::set<std::size_t> &pending() const;

    const outcome_map &resolved() const;

    const std::set<std::size_t> &skipped() const;

    /**
     * @brief 根据目前已经评测的测试点计算的分数，用于实时分数
     */
    score current_score() const;

private:
    valuer_context context;
    valuer_strategy strategy;
    valuer_phase current_phase = valuer_phase::INIT;
    std::set<std::size_t> pending_tests;

    valuer_action decide();
};

}  // namespace arbiter
