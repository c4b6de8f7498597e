#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "valuer/valuer.hpp"

using namespace std;
using namespace arbiter;

/**
 * @brief 没有测试组配置时，每个测试点 1 分
 */
static problem make_problem(size_t test_count, scoring_mode mode) {
    problem prob;
    prob.id = "valuer";
    prob.tests.resize(test_count);
    prob.valuer.mode = mode;
    group_spec group;
    group.name = "default";
    group.score = (uint32_t)test_count;
    group.scoring = group_scoring::EACH;
    for (size_t i = 0; i < test_count; ++i) group.tests.push_back(i);
    prob.valuer.groups.push_back(group);
    return prob;
}

static group_spec make_group(const string &name, uint32_t score, vector<size_t> tests, vector<size_t> depends_on = {}) {
    group_spec group;
    group.name = name;
    group.score = score;
    group.tests = move(tests);
    group.depends_on = move(depends_on);
    group.dependent = !group.depends_on.empty();
    return group;
}

/**
 * @brief samples(0) <- small(1, 2) <- large(3)
 */
static problem make_grouped_problem() {
    problem prob;
    prob.id = "grouped";
    prob.tests.resize(4);
    prob.valuer.mode = scoring_mode::GROUPED;
    prob.valuer.groups.push_back(make_group("samples", 10, {0}));
    prob.valuer.groups.push_back(make_group("small", 30, {1, 2}, {0}));
    prob.valuer.groups.push_back(make_group("large", 60, {3}, {1}));
    return prob;
}

static test_outcome of(status verdict) {
    test_outcome outcome;
    outcome.verdict = verdict;
    return outcome;
}

static outcome_map all(const vector<size_t> &indices, status verdict) {
    outcome_map outcomes;
    for (size_t index : indices) outcomes[index] = of(verdict);
    return outcomes;
}

static vector<size_t> requested(const valuer_action &action) {
    auto request = get_if<run_tests>(&action);
    return request ? request->indices : vector<size_t>();
}

TEST(ValuerTest, ClassifyPicksWorstContestantFailure) {
    EXPECT_EQ(classify({}), status::ACCEPTED);
    EXPECT_EQ(classify({{0, of(status::ACCEPTED)}, {1, of(status::ACCEPTED)}}), status::ACCEPTED);
    EXPECT_EQ(classify({{0, of(status::WRONG_ANSWER)}, {1, of(status::TIME_LIMIT_EXCEEDED)}}), status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(classify({{0, of(status::SECURITY_VIOLATION)}, {1, of(status::WRONG_ANSWER)}}), status::SECURITY_VIOLATION);
    EXPECT_EQ(classify({{0, of(status::ACCEPTED)}, {1, of(status::JUDGE_FAULT)}}), status::JUDGE_FAULT);
    EXPECT_EQ(classify({{0, of(status::JUDGE_FAULT)}, {1, of(status::WRONG_ANSWER)}}), status::WRONG_ANSWER);
}

TEST(ValuerTest, SimpleSumRunsEverythingAtOnce) {
    problem prob = make_problem(3, scoring_mode::SIMPLE_SUM);
    valuer_engine engine(prob);
    EXPECT_EQ(engine.phase(), valuer_phase::INIT);

    valuer_action action = engine.begin();
    EXPECT_EQ(requested(action), vector<size_t>({0, 1, 2}));
    EXPECT_EQ(engine.phase(), valuer_phase::WAITING_FOR_OUTCOMES);

    action = engine.next({{0, of(status::ACCEPTED)}, {1, of(status::WRONG_ANSWER)}, {2, of(status::ACCEPTED)}});
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(engine.phase(), valuer_phase::FINISHED);

    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::WRONG_ANSWER);
    EXPECT_EQ(decision.result.points, 2u);
    EXPECT_EQ(decision.result.max_points, 3u);
    EXPECT_FALSE(decision.result.passed);
}

TEST(ValuerTest, EmptyProblemFinishesImmediately) {
    problem prob = make_problem(0, scoring_mode::SIMPLE_SUM);
    valuer_engine engine(prob);
    valuer_action action = engine.begin();
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(get<finish>(action).verdict, status::ACCEPTED);
    EXPECT_TRUE(get<finish>(action).result.passed);
}

TEST(ValuerTest, StopOnFirstFailure) {
    problem prob = make_problem(4, scoring_mode::STOP_ON_FIRST_FAILURE);
    valuer_engine engine(prob);

    EXPECT_EQ(requested(engine.begin()), vector<size_t>({0}));
    EXPECT_EQ(requested(engine.next({{0, of(status::ACCEPTED)}})), vector<size_t>({1}));
    valuer_action action = engine.next({{1, of(status::RUNTIME_ERROR)}});
    ASSERT_TRUE(holds_alternative<finish>(action));

    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::RUNTIME_ERROR);
    EXPECT_EQ(decision.result.points, 0u);
    EXPECT_EQ(decision.result.max_points, 4u);
    EXPECT_EQ(engine.resolved().size(), 2u);
}

TEST(ValuerTest, StopOnFirstFailureAllPassed) {
    problem prob = make_problem(2, scoring_mode::STOP_ON_FIRST_FAILURE);
    valuer_engine engine(prob);
    engine.begin();
    engine.next({{0, of(status::ACCEPTED)}});
    valuer_action action = engine.next({{1, of(status::ACCEPTED)}});
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(get<finish>(action).verdict, status::ACCEPTED);
    EXPECT_EQ(get<finish>(action).result.points, 2u);
}

TEST(ValuerTest, GroupedRunsGroupsInDependencyOrder) {
    problem prob = make_grouped_problem();
    valuer_engine engine(prob);

    EXPECT_EQ(requested(engine.begin()), vector<size_t>({0}));
    EXPECT_EQ(requested(engine.next(all({0}, status::ACCEPTED))), vector<size_t>({1, 2}));
    EXPECT_EQ(requested(engine.next(all({1, 2}, status::ACCEPTED))), vector<size_t>({3}));
    valuer_action action = engine.next(all({3}, status::ACCEPTED));
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(get<finish>(action).result.points, 100u);
    EXPECT_TRUE(get<finish>(action).result.passed);
}

TEST(ValuerTest, GroupedSkipCascades) {
    problem prob = make_grouped_problem();
    valuer_engine engine(prob);

    engine.begin();
    valuer_action action = engine.next(all({0}, status::WRONG_ANSWER));
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(engine.skipped(), set<size_t>({1, 2, 3}));

    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::WRONG_ANSWER);
    EXPECT_EQ(decision.result.points, 0u);
    EXPECT_EQ(decision.result.max_points, 100u);
    ASSERT_EQ(decision.result.groups.size(), 3u);
    EXPECT_FALSE(decision.result.groups[0].skipped);
    EXPECT_TRUE(decision.result.groups[1].skipped);
    EXPECT_TRUE(decision.result.groups[2].skipped);
}

TEST(ValuerTest, GroupedJudgeFaultBlocksDependents) {
    problem prob = make_grouped_problem();
    valuer_engine engine(prob);

    engine.begin();
    valuer_action action = engine.next(all({0}, status::JUDGE_FAULT));
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(engine.skipped().size(), 3u);

    // 评测故障不算选手的错误，但是前置测试组没有通过，依赖它的测试组都不得分
    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::JUDGE_FAULT);
    EXPECT_FALSE(decision.result.passed);
    EXPECT_EQ(decision.result.points, 0u);
    EXPECT_EQ(decision.result.max_points, 100u);
    ASSERT_EQ(decision.result.groups.size(), 3u);
    EXPECT_EQ(decision.result.groups[0].points, 0u);
    EXPECT_FALSE(decision.result.groups[0].skipped);
    EXPECT_TRUE(decision.result.groups[1].skipped);
    EXPECT_EQ(decision.result.groups[1].points, 0u);
    EXPECT_TRUE(decision.result.groups[2].skipped);
    EXPECT_EQ(decision.result.groups[2].points, 0u);
}

TEST(ValuerTest, GroupedJudgeFaultInsideGroupKeepsOtherCredit) {
    problem prob = make_grouped_problem();
    prob.valuer.groups[1].scoring = group_scoring::EACH;
    valuer_engine engine(prob);

    engine.begin();
    engine.next(all({0}, status::ACCEPTED));
    valuer_action action = engine.next({{1, of(status::ACCEPTED)}, {2, of(status::JUDGE_FAULT)}});
    ASSERT_TRUE(holds_alternative<finish>(action));

    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::JUDGE_FAULT);
    EXPECT_EQ(decision.result.points, 10u + 15u);
    EXPECT_EQ(engine.skipped(), set<size_t>({3}));
}

TEST(ValuerTest, StopOnFirstFailureStopsOnJudgeFault) {
    problem prob = make_problem(3, scoring_mode::STOP_ON_FIRST_FAILURE);
    valuer_engine engine(prob);

    engine.begin();
    valuer_action action = engine.next({{0, of(status::JUDGE_FAULT)}});
    ASSERT_TRUE(holds_alternative<finish>(action));

    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::JUDGE_FAULT);
    EXPECT_EQ(decision.result.points, 0u);
    EXPECT_EQ(decision.result.max_points, 3u);
    EXPECT_EQ(engine.resolved().size(), 1u);
    EXPECT_TRUE(engine.skipped().empty());
}

TEST(ValuerTest, IndependentGroupRunsAfterFailedPrerequisite) {
    problem prob = make_grouped_problem();
    prob.valuer.groups[2].dependent = false;
    prob.valuer.groups[2].depends_on = {0};
    valuer_engine engine(prob);

    engine.begin();
    EXPECT_EQ(requested(engine.next(all({0}, status::WRONG_ANSWER))), vector<size_t>({3}));
    valuer_action action = engine.next(all({3}, status::ACCEPTED));
    ASSERT_TRUE(holds_alternative<finish>(action));
    EXPECT_EQ(get<finish>(action).result.points, 60u);
    EXPECT_EQ(engine.skipped(), set<size_t>({1, 2}));
}

TEST(ValuerTest, EachScoringRoundsDown) {
    problem prob;
    prob.tests.resize(3);
    prob.valuer.mode = scoring_mode::SIMPLE_SUM;
    group_spec group = make_group("all", 10, {0, 1, 2});
    group.scoring = group_scoring::EACH;
    prob.valuer.groups.push_back(group);
    prob.valuer.groups.push_back(make_group("empty", 5, {}));

    valuer_context ctx{prob, all({0, 1}, status::ACCEPTED), {}, {}};
    ctx.resolved[2] = of(status::WRONG_ANSWER);
    score s = compute_score(ctx);
    EXPECT_EQ(s.groups[0].points, 6u);
    EXPECT_EQ(s.groups[1].points, 5u);
    EXPECT_EQ(s.points, 11u);
    EXPECT_EQ(s.max_points, 15u);
}

TEST(ValuerTest, WorstVerdictWinsWhileFormulaDecidesScore) {
    problem prob;
    prob.tests.resize(2);
    prob.valuer.mode = scoring_mode::SIMPLE_SUM;
    prob.valuer.groups.push_back(make_group("first", 50, {0}));
    prob.valuer.groups.push_back(make_group("second", 50, {1}));

    valuer_engine engine(prob);
    engine.begin();
    valuer_action action = engine.next({{0, of(status::ACCEPTED)}, {1, of(status::SECURITY_VIOLATION)}});
    auto &decision = get<finish>(action);
    EXPECT_EQ(decision.verdict, status::SECURITY_VIOLATION);
    EXPECT_EQ(decision.result.points, 50u);
    EXPECT_FALSE(decision.result.passed);
}

TEST(ValuerTest, EngineRejectsProtocolViolations) {
    problem prob = make_problem(2, scoring_mode::SIMPLE_SUM);

    {
        valuer_engine engine(prob);
        EXPECT_THROW(engine.next({}), invariant_violation);
        engine.begin();
        EXPECT_THROW(engine.begin(), invariant_violation);
        EXPECT_THROW(engine.next({{0, of(status::ACCEPTED)}}), invariant_violation);
        EXPECT_THROW(engine.next({{0, of(status::ACCEPTED)}, {1, of(status::ACCEPTED)}, {5, of(status::ACCEPTED)}}), invariant_violation);
        EXPECT_EQ(engine.pending(), set<size_t>({0, 1}));
    }

    {
        valuer_engine engine(prob);
        engine.begin();
        engine.next(all({0, 1}, status::ACCEPTED));
        EXPECT_THROW(engine.next({}), invariant_violation);
    }
}

TEST(ValuerTest, CurrentScoreTracksProgress) {
    problem prob = make_grouped_problem();
    valuer_engine engine(prob);
    engine.begin();
    engine.next(all({0}, status::ACCEPTED));
    score live = engine.current_score();
    EXPECT_EQ(live.points, 10u);
    EXPECT_EQ(live.max_points, 100u);
}
