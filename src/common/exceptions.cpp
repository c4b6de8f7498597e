#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arbiter {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

problem_not_found::problem_not_found(const string &problem_id)
    : judge_exception("Problem " + problem_id + " not found") {}

problem_corrupt::problem_corrupt(const string &problem_id, const string &reason)
    : judge_exception("Problem " + problem_id + " is corrupt: " + reason) {}

toolchain_not_found::toolchain_not_found(const string &toolchain_id, const string &reason)
    : judge_exception("Toolchain " + toolchain_id + " not found: " + reason) {}

infrastructure_error::infrastructure_error()
    : judge_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : judge_exception(message) {}

deadline_exceeded::deadline_exceeded()
    : judge_exception("Submission deadline exceeded") {}

deadline_exceeded::deadline_exceeded(const string &message)
    : judge_exception(message) {}

job_cancelled::job_cancelled(const string &job_id)
    : judge_exception("Job " + job_id + " was cancelled") {}

invariant_violation::invariant_violation(const string &message)
    : judge_exception(message) {}

}  // namespace arbiter
