#include "monitor/monitor.hpp"

namespace arbiter {
using namespace std;

monitor::~monitor() = default;

void monitor::start_submission(const submission &) {}

void monitor::state_changed(const submission &, pipeline_state) {}

void monitor::start_test(const submission &, size_t, unsigned) {}

void monitor::end_test(const submission &, size_t, const test_outcome &) {}

void monitor::batch_finished(const submission &, const vector<size_t> &, const outcome_map &) {}

void monitor::live_score(const submission &, const score &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void monitor::end_submission(const submission &, const judge_result &) {}

}  // namespace arbiter
