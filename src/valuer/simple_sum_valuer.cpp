#include "valuer/valuer.hpp"

namespace arbiter {
using namespace std;

valuer_action simple_sum_valuer::next(valuer_context &ctx) {
    run_tests request;
    for (size_t i = 0; i < ctx.prob.tests.size(); ++i)
        if (!ctx.resolved.count(i))
            request.indices.push_back(i);
    if (!request.indices.empty())
        return request;

    return finish{compute_score(ctx), classify(ctx.resolved)};
}

}  // namespace arbiter
