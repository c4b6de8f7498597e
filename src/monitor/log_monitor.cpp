#include "monitor/log_monitor.hpp"
#include <glog/logging.h>

namespace arbiter {
using namespace std;

static const char *get_worker_state_name(worker_state state) {
    switch (state) {
        case worker_state::START:
            return "start";
        case worker_state::JUDGING:
            return "judging";
        case worker_state::IDLE:
            return "idle";
        case worker_state::STOPPED:
            return "stopped";
        case worker_state::CRASHED:
            return "crashed";
    }
    return "unknown";
}

void log_monitor::start_submission(const submission &submit) {
    LOG(INFO) << "Submission " << submit.id << " started, problem " << submit.problem_id << ", toolchain " << submit.toolchain_id;
}

void log_monitor::state_changed(const submission &submit, pipeline_state state) {
    LOG(INFO) << "Submission " << submit.id << " is now " << get_pipeline_state_name(state);
}

void log_monitor::end_test(const submission &submit, size_t test_index, const test_outcome &outcome) {
    LOG(INFO) << "Submission " << submit.id << " test " << test_index << ": " << get_status_code(outcome.verdict)
              << ", time " << outcome.time << "ms, memory " << outcome.memory << " bytes";
}

void log_monitor::live_score(const submission &submit, const score &current) {
    LOG(INFO) << "Submission " << submit.id << " live score " << current.points << "/" << current.max_points;
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << information;
    else
        LOG(INFO) << "Worker " << worker_id << " is " << get_worker_state_name(state);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << message;
}

void log_monitor::end_submission(const submission &submit, const judge_result &result) {
    LOG(INFO) << "Submission " << submit.id << " finished: " << get_pipeline_state_name(result.state)
              << ", verdict " << get_status_code(result.verdict)
              << (result.final_score ? ", score " + to_string(result.final_score->points) + "/" + to_string(result.final_score->max_points) : "");
}

}  // namespace arbiter
