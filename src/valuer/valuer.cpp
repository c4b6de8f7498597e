#include "valuer/valuer.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace arbiter {
using namespace std;

valuer_strategy make_valuer_strategy(scoring_mode mode) {
    switch (mode) {
        case scoring_mode::SIMPLE_SUM:
            return simple_sum_valuer();
        case scoring_mode::STOP_ON_FIRST_FAILURE:
            return stop_on_first_failure_valuer();
        case scoring_mode::GROUPED:
            return grouped_valuer();
    }
    throw invalid_argument("unknown scoring mode");
}

score compute_score(const valuer_context &ctx) {
    score result;
    for (size_t i = 0; i < ctx.prob.valuer.groups.size(); ++i) {
        auto &group = ctx.prob.valuer.groups[i];
        group_score gs;
        gs.name = group.name;
        gs.max_points = group.score;
        gs.skipped = ctx.skipped_groups.count(i) > 0;

        if (!gs.skipped) {
            size_t passed = 0;
            for (size_t test : group.tests) {
                auto it = ctx.resolved.find(test);
                if (it != ctx.resolved.end() && it->second.verdict == status::ACCEPTED)
                    ++passed;
            }

            if (group.tests.empty())
                gs.points = group.score;
            else if (group.scoring == group_scoring::EACH)
                gs.points = (uint32_t)((uint64_t)group.score * passed / group.tests.size());
            else
                gs.points = passed == group.tests.size() ? group.score : 0;
        }

        result.points += gs.points;
        result.max_points += gs.max_points;
        result.groups.push_back(gs);
    }
    result.passed = classify(ctx.resolved) == status::ACCEPTED;
    return result;
}

status classify(const outcome_map &resolved) {
    status worst = status::ACCEPTED;
    bool judge_fault = false;
    for (auto &[index, outcome] : resolved) {
        if (outcome.verdict == status::JUDGE_FAULT)
            judge_fault = true;
        else if (severity(outcome.verdict) > severity(worst))
            worst = outcome.verdict;
    }
    if (worst == status::ACCEPTED && judge_fault)
        return status::JUDGE_FAULT;
    return worst;
}

valuer_engine::valuer_engine(const problem &prob)
    : context{prob, {}, {}, {}}, strategy(make_valuer_strategy(prob.valuer.mode)) {}

valuer_action valuer_engine::begin() {
    if (current_phase != valuer_phase::INIT)
        throw invariant_violation("valuer has already begun");
    return decide();
}

valuer_action valuer_engine::next(const outcome_map &outcomes) {
    if (current_phase != valuer_phase::WAITING_FOR_OUTCOMES)
        throw invariant_violation(current_phase == valuer_phase::FINISHED
                                      ? "outcomes supplied after valuer finished"
                                      : "outcomes supplied before valuer began");

    for (auto &[index, outcome] : outcomes)
        if (!pending_tests.count(index))
            throw invariant_violation(fmt::format("outcome for test {} was not requested", index));
    if (outcomes.size() != pending_tests.size())
        throw invariant_violation(fmt::format("partial batch: {} of {} outcomes supplied", outcomes.size(), pending_tests.size()));

    for (auto &[index, outcome] : outcomes)
        context.resolved[index] = outcome;
    pending_tests.clear();
    return decide();
}

valuer_action valuer_engine::decide() {
    valuer_action action = visit([this](auto &s) { return s.next(context); }, strategy);

    visit(overloaded{
              [this](const run_tests &request) {
                  if (request.indices.empty())
                      throw invariant_violation("valuer requested an empty batch");
                  set<size_t> batch;
                  for (size_t index : request.indices) {
                      if (index >= context.prob.tests.size())
                          throw invariant_violation(fmt::format("valuer requested test {} out of {}", index, context.prob.tests.size()));
                      if (context.resolved.count(index))
                          throw invariant_violation(fmt::format("valuer requested already resolved test {}", index));
                      if (context.skipped.count(index))
                          throw invariant_violation(fmt::format("valuer requested skipped test {}", index));
                      if (!batch.insert(index).second)
                          throw invariant_violation(fmt::format("valuer requested test {} twice", index));
                  }
                  pending_tests = move(batch);
                  current_phase = valuer_phase::WAITING_FOR_OUTCOMES;
              },
              [this](const finish &) {
                  current_phase = valuer_phase::FINISHED;
              }},
          action);
    return action;
}

valuer_phase valuer_engine::phase() const {
    return current_phase;
}

const set<size_t> &valuer_engine::pending() const {
    return pending_tests;
}

const outcome_map &valuer_engine::resolved() const {
    return context.resolved;
}

const set<size_t> &valuer_engine::skipped() const {
    return context.skipped;
}

score valuer_engine::current_score() const {
    return compute_score(context);
}

}  // namespace arbiter
