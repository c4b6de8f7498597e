#include "valuer/valuer.hpp"

namespace arbiter {
using namespace std;

valuer_action stop_on_first_failure_valuer::next(valuer_context &ctx) {
    bool failed = false;
    for (auto &[index, outcome] : ctx.resolved)
        if (outcome.verdict != status::ACCEPTED)
            failed = true;

    if (!failed) {
        for (size_t i = 0; i < ctx.prob.tests.size(); ++i)
            if (!ctx.resolved.count(i))
                return run_tests{{i}};
    }

    score result = compute_score(ctx);
    if (failed) {
        // 全部通过才得分
        result.points = 0;
        for (auto &group : result.groups) group.points = 0;
    }
    return finish{result, classify(ctx.resolved)};
}

}  // namespace arbiter
