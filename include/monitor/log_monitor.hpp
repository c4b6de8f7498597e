#pragma once

#include "monitor/monitor.hpp"

namespace arbiter {

/**
 * @brief 将监控信息写入 glog 日志
 */
struct log_monitor : public monitor {
    void start_submission(const submission &submit) override;

    void state_changed(const submission &submit, pipeline_state state) override;

    void end_test(const submission &submit, std::size_t test_index, const test_outcome &outcome) override;

    void live_score(const submission &submit, const score &current) override;

    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;

    void report_error(const std::string &message) override;

    void end_submission(const submission &submit, const judge_result &result) override;
};

}  // namespace arbiter
