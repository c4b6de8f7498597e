#include "valuer/valuer.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace arbiter {
using namespace std;

static bool all_resolved(const valuer_context &ctx, const group_spec &group) {
    for (size_t test : group.tests)
        if (!ctx.resolved.count(test)) return false;
    return true;
}

static bool all_accepted(const valuer_context &ctx, const group_spec &group) {
    for (size_t test : group.tests) {
        auto it = ctx.resolved.find(test);
        if (it == ctx.resolved.end() || it->second.verdict != status::ACCEPTED) return false;
    }
    return true;
}

valuer_action grouped_valuer::next(valuer_context &ctx) {
    auto &groups = ctx.prob.valuer.groups;

    auto settled = [&](size_t g) {
        return ctx.skipped_groups.count(g) || (started_groups.count(g) && all_resolved(ctx, groups[g]));
    };
    auto passed = [&](size_t g) {
        return !ctx.skipped_groups.count(g) && started_groups.count(g) && all_accepted(ctx, groups[g]);
    };

    // 不断确定可以开始或者需要跳过的测试组，直到没有变化。
    // 没有测试点的测试组开始后立即完成，可能使依赖它的测试组也能开始。
    for (bool changed = true; changed;) {
        changed = false;
        for (size_t g = 0; g < groups.size(); ++g) {
            if (started_groups.count(g) || ctx.skipped_groups.count(g)) continue;

            bool ready = true, prerequisites_passed = true;
            for (size_t dep : groups[g].depends_on) {
                if (!settled(dep)) ready = false;
                else if (!passed(dep)) prerequisites_passed = false;
            }
            if (!ready) continue;

            if (groups[g].dependent && !prerequisites_passed) {
                DLOG(INFO) << "Skipping group " << groups[g].name << " of problem " << ctx.prob.id;
                ctx.skipped_groups.insert(g);
                for (size_t test : groups[g].tests) ctx.skipped.insert(test);
            } else {
                started_groups.insert(g);
            }
            changed = true;
        }
    }

    run_tests request;
    for (size_t g : started_groups)
        for (size_t test : groups[g].tests)
            if (!ctx.resolved.count(test))
                request.indices.push_back(test);
    if (!request.indices.empty()) {
        sort(request.indices.begin(), request.indices.end());
        return request;
    }

    return finish{compute_score(ctx), classify(ctx.resolved)};
}

}  // namespace arbiter
