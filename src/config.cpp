#include "config.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

pipeline_settings judge_settings::get_pipeline_settings() const {
    pipeline_settings settings;
    settings.max_parallel_tests = max_parallel_tests;
    settings.retry = retry;
    settings.deadline = deadline;
    settings.checker_logs_dir = checker_logs_dir;
    return settings;
}

void from_json(const json &j, judge_settings &settings) {
    if (j.count("problems_dir"))
        settings.problems_dir = j.at("problems_dir").get<string>();
    if (j.count("toolchains_dir"))
        settings.toolchains_dir = j.at("toolchains_dir").get<string>();
    if (j.count("executor"))
        j.at("executor").get_to(settings.executor_address);
    if (j.count("checker_logs_dir"))
        settings.checker_logs_dir = j.at("checker_logs_dir").get<string>();
    if (j.count("max_parallel_tests"))
        j.at("max_parallel_tests").get_to(settings.max_parallel_tests);
    if (j.count("max_judging"))
        j.at("max_judging").get_to(settings.max_judging);
    if (j.count("retry")) {
        const json &retry = j.at("retry");
        if (retry.count("attempts"))
            retry.at("attempts").get_to(settings.retry.max_attempts);
        if (retry.count("initial_backoff_ms"))
            settings.retry.initial_backoff = chrono::milliseconds(retry.at("initial_backoff_ms").get<long long>());
        if (retry.count("max_backoff_ms"))
            settings.retry.max_backoff = chrono::milliseconds(retry.at("max_backoff_ms").get<long long>());
        if (retry.count("multiplier"))
            retry.at("multiplier").get_to(settings.retry.multiplier);
    }
    if (j.count("deadline_ms"))
        settings.deadline = chrono::milliseconds(j.at("deadline_ms").get<long long>());
    if (j.count("executor_timeout_ms"))
        settings.executor_timeout = chrono::milliseconds(j.at("executor_timeout_ms").get<long long>());
}

}  // namespace arbiter
