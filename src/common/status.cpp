#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILE_ERROR, "Compile Error")
    (status::PRESENTATION_ERROR, "Presentation Error")
    (status::SECURITY_VIOLATION, "Security Violation")
    (status::JUDGE_FAULT, "Judge Fault");

static const unordered_map<status, const char *> status_code = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "WrongAnswer")
    (status::TIME_LIMIT_EXCEEDED, "TimeLimitExceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "MemoryLimitExceeded")
    (status::RUNTIME_ERROR, "RuntimeError")
    (status::COMPILE_ERROR, "CompileError")
    (status::PRESENTATION_ERROR, "PresentationError")
    (status::SECURITY_VIOLATION, "SecurityViolation")
    (status::JUDGE_FAULT, "JudgeFault");

static const unordered_map<status, int> status_severity = boost::assign::map_list_of
    (status::ACCEPTED, 0)
    (status::JUDGE_FAULT, 1)
    (status::WRONG_ANSWER, 2)
    (status::PRESENTATION_ERROR, 3)
    (status::RUNTIME_ERROR, 4)
    (status::TIME_LIMIT_EXCEEDED, 5)
    (status::MEMORY_LIMIT_EXCEEDED, 6)
    (status::SECURITY_VIOLATION, 7)
    (status::COMPILE_ERROR, 8);
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_code(status stat) {
    return status_code.at(stat);
}

status parse_status_code(const string &code) {
    for (auto &[stat, name] : status_code)
        if (code == name) return stat;
    throw invalid_argument("Unknown status code " + code);
}

bool is_contestant_failure(status stat) {
    return stat != status::ACCEPTED && stat != status::JUDGE_FAULT;
}

int severity(status stat) {
    return status_severity.at(stat);
}

}  // namespace arbiter
