#include "judge/judge_result.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/base64.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<pipeline_state, const char *> pipeline_state_names = boost::assign::map_list_of
    (pipeline_state::QUEUED, "Queued")
    (pipeline_state::COMPILING, "Compiling")
    (pipeline_state::COMPILE_FAILED, "CompileFailed")
    (pipeline_state::JUDGING, "Judging")
    (pipeline_state::SCORED, "Scored")
    (pipeline_state::FAULTED, "Faulted");

static const unordered_map<fault_reason, const char *> fault_reason_names = boost::assign::map_list_of
    (fault_reason::NONE, "None")
    (fault_reason::PROBLEM_UNAVAILABLE, "ProblemUnavailable")
    (fault_reason::TOOLCHAIN_UNAVAILABLE, "ToolchainUnavailable")
    (fault_reason::COMPILE_INFRASTRUCTURE, "CompileInfrastructure")
    (fault_reason::DEADLINE_EXCEEDED, "DeadlineExceeded")
    (fault_reason::INVARIANT_VIOLATION, "InvariantViolation")
    (fault_reason::INTERNAL_ERROR, "InternalError")
    (fault_reason::SERVICE_STOPPED, "ServiceStopped");
// clang-format on

const char *get_pipeline_state_name(pipeline_state state) {
    return pipeline_state_names.at(state);
}

bool is_terminal(pipeline_state state) {
    return state == pipeline_state::COMPILE_FAILED || state == pipeline_state::SCORED || state == pipeline_state::FAULTED;
}

const char *get_fault_reason_name(fault_reason reason) {
    return fault_reason_names.at(reason);
}

const char *get_test_disposition_name(test_disposition disposition) {
    switch (disposition) {
        case test_disposition::EXECUTED:
            return "executed";
        case test_disposition::SKIPPED:
            return "skipped";
        case test_disposition::NOT_RUN:
            return "not_run";
    }
    return "unknown";
}

void to_json(json &j, const test_outcome &outcome) {
    // 输出可能不是合法的 UTF-8，以 base64 编码
    j = {{"verdict", get_status_code(outcome.verdict)},
         {"time_ms", outcome.time},
         {"memory", outcome.memory},
         {"stdout", base64_encode(outcome.output)},
         {"stderr", base64_encode(outcome.error_output)}};
}

void to_json(json &j, const score &s) {
    json groups = json::array();
    for (auto &group : s.groups)
        groups.push_back({{"name", group.name},
                          {"points", group.points},
                          {"max_points", group.max_points},
                          {"skipped", group.skipped}});
    j = {{"passed", s.passed},
         {"points", s.points},
         {"max_points", s.max_points},
         {"groups", groups}};
}

void to_json(json &j, const judge_result &result) {
    json tests = json::array();
    for (auto &trace : result.tests) {
        json test = {{"index", trace.index},
                     {"disposition", get_test_disposition_name(trace.disposition)}};
        if (trace.outcome) test.update(json(*trace.outcome));
        tests.push_back(test);
    }

    j = {{"id", result.submission_id},
         {"state", get_pipeline_state_name(result.state)},
         {"verdict", get_status_code(result.verdict)},
         {"fault_reason", get_fault_reason_name(result.reason)},
         {"message", result.message},
         {"score", result.final_score ? json(*result.final_score) : json()},
         {"compile_log", result.compile_log},
         {"tests", tests}};
}

}  // namespace arbiter
