#include "judge/pipeline.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <exception>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace arbiter {
using namespace std;
using namespace arbiter::executor;

judge_pipeline::judge_pipeline(submission submit,
                               problem_repository &problems,
                               toolchain_repository &toolchains,
                               executor_client &executor,
                               pipeline_settings settings,
                               vector<monitor *> monitors)
    : submit(move(submit)), problems(problems), toolchains(toolchains), executor(executor), settings(move(settings)), monitors(move(monitors)) {
    if (this->settings.max_parallel_tests == 0) this->settings.max_parallel_tests = 1;
    if (this->settings.retry.max_attempts == 0) this->settings.retry.max_attempts = 1;
}

pipeline_state judge_pipeline::state() const {
    return current_state.load();
}

void judge_pipeline::call_monitor(const function<void(monitor &)> &callback) {
    for (monitor *m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Submission " << submit.id << " has crashed when reporting monitoring information, " << ex.what();
        }
    }
}

void judge_pipeline::transition(pipeline_state state) {
    DLOG(INFO) << "Submission " << submit.id << ": " << get_pipeline_state_name(current_state.load()) << " -> " << get_pipeline_state_name(state);
    current_state = state;
    call_monitor([&](monitor &m) { m.state_changed(submit, state); });
}

void judge_pipeline::fault(judge_result &result, fault_reason reason, const string &message) {
    cancel_in_flight();
    LOG(WARNING) << "Submission " << submit.id << " faulted (" << get_fault_reason_name(reason) << "): " << message;
    result.state = pipeline_state::FAULTED;
    result.verdict = status::JUDGE_FAULT;
    result.reason = reason;
    result.message = message;
    result.final_score.reset();
    transition(pipeline_state::FAULTED);
}

void judge_pipeline::cancel_in_flight() {
    map<string, job_handle> jobs;
    {
        scoped_lock guard(in_flight_mut);
        cancelled = true;
        jobs.swap(in_flight);
    }
    cancel_signal.notify_all();
    for (auto &[id, handle] : jobs) {
        LOG(INFO) << "Submission " << submit.id << " cancelling job " << id;
        executor.cancel(handle);
    }
}

run_outcome judge_pipeline::execute_with_retry(const function<job_handle(unsigned)> &submit_job) {
    auto is_cancelled = [&] {
        scoped_lock guard(in_flight_mut);
        return cancelled;
    };

    for (unsigned attempt = 1;; ++attempt) {
        if (chrono::steady_clock::now() >= deadline)
            throw deadline_exceeded();
        if (is_cancelled())
            throw job_cancelled("submission " + submit.id);

        optional<job_handle> handle;
        try {
            handle = submit_job(attempt);
            bool registered = false;
            {
                scoped_lock guard(in_flight_mut);
                if (!cancelled) {
                    in_flight[handle->id] = *handle;
                    registered = true;
                }
            }
            if (!registered) {
                // cancel_in_flight 已经执行，这个任务不会再被取消
                executor.cancel(*handle);
                throw job_cancelled(handle->id);
            }

            run_outcome outcome = executor.await_result(*handle, deadline);
            {
                scoped_lock guard(in_flight_mut);
                in_flight.erase(handle->id);
            }
            return outcome;
        } catch (infrastructure_error &ex) {
            if (handle) {
                scoped_lock guard(in_flight_mut);
                in_flight.erase(handle->id);
            }
            // 任务被取消后执行器返回的错误不需要重试
            if (is_cancelled())
                throw job_cancelled(handle ? handle->id : "submission " + submit.id);
            if (attempt >= settings.retry.max_attempts) {
                LOG(ERROR) << "Submission " << submit.id << " giving up after " << attempt << " attempts: " << ex.what();
                throw;
            }

            auto wait = settings.retry.backoff(attempt);
            LOG(WARNING) << "Submission " << submit.id << " attempt " << attempt << " failed: " << ex.what()
                         << ", retrying in " << wait.count() << "ms";
            chrono::steady_clock::time_point wake = chrono::steady_clock::now() + wait;
            {
                unique_lock lock(in_flight_mut);
                if (cancel_signal.wait_until(lock, min(wake, deadline), [&] { return cancelled; }))
                    throw job_cancelled("submission " + submit.id);
            }
            if (wake >= deadline)
                throw deadline_exceeded();
        } catch (deadline_exceeded &) {
            // 任务仍然在执行，留给 cancel_in_flight 取消
            throw;
        } catch (...) {
            if (handle) {
                scoped_lock guard(in_flight_mut);
                in_flight.erase(handle->id);
            }
            throw;
        }
    }
}

run_outcome judge_pipeline::compile(const toolchain &tc) {
    return execute_with_retry([&](unsigned) {
        return executor.submit_compile(tc, submit.source);
    });
}

void judge_pipeline::save_checker_log(size_t index, const string &log) {
    if (!settings.checker_logs_dir) return;
    try {
        auto path = *settings.checker_logs_dir / assert_safe_file_name(submit.id) / to_string(index);
        write_file_content(path, log);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to save checker log of submission " << submit.id << " test " << index << ": " << ex.what();
    }
}

test_outcome judge_pipeline::run_test(const problem &prob, const toolchain &tc, const compiled_artifact &artifact, size_t index) {
    auto &test = prob.tests[index];
    test_input input;
    input.index = index;
    input.input = test.input;
    input.answer = test.answer;
    input.checker = prob.checker;

    test_outcome outcome;
    try {
        run_outcome result = execute_with_retry([&](unsigned attempt) {
            call_monitor([&](monitor &m) { m.start_test(submit, index, attempt); });
            return executor.submit_run(tc, artifact, input, test.limits);
        });
        save_checker_log(index, result.checker_log);
        outcome.verdict = result.verdict;
        outcome.time = result.time;
        outcome.memory = result.memory;
        outcome.output = move(result.output);
        outcome.error_output = move(result.error_output);
    } catch (infrastructure_error &) {
        // 只影响这个测试点，作为 JUDGE_FAULT 交给 valuer
        outcome.verdict = status::JUDGE_FAULT;
    }
    return outcome;
}

outcome_map judge_pipeline::run_batch(const problem &prob, const toolchain &tc, const compiled_artifact &artifact, const vector<size_t> &indices) {
    concurrent_queue<size_t> queue;
    for (size_t index : indices) queue.push(index);

    mutex outcomes_mut;
    outcome_map outcomes;
    exception_ptr error;
    atomic<bool> aborted{false};

    auto worker = [&] {
        size_t index;
        while (!aborted && queue.try_pop(index)) {
            try {
                test_outcome outcome = run_test(prob, tc, artifact, index);
                {
                    scoped_lock guard(outcomes_mut);
                    outcomes[index] = outcome;
                }
                call_monitor([&](monitor &m) { m.end_test(submit, index, outcome); });
            } catch (...) {
                bool first = false;
                {
                    scoped_lock guard(outcomes_mut);
                    if (!error) {
                        error = current_exception();
                        first = true;
                    }
                    aborted = true;
                }
                // 整个提交已经失败，其他测试点的任务不再需要
                if (first) cancel_in_flight();
            }
        }
    };

    size_t parallelism = min(settings.max_parallel_tests, indices.size());
    vector<thread> threads;
    for (size_t i = 1; i < parallelism; ++i) threads.emplace_back(worker);
    worker();
    for (auto &t : threads) t.join();

    if (error) rethrow_exception(error);
    return outcomes;
}

judge_result judge_pipeline::run() {
    judge_result result;
    result.submission_id = submit.id;
    deadline = chrono::steady_clock::now() + settings.deadline;

    call_monitor([&](monitor &m) { m.start_submission(submit); });
    LOG(INFO) << "Judging submission " << submit.id << " of problem " << submit.problem_id << " with toolchain " << submit.toolchain_id;

    auto finish_submission = [&]() -> judge_result & {
        result.state = current_state;
        call_monitor([&](monitor &m) { m.end_submission(submit, result); });
        return result;
    };

    try {
        shared_ptr<const problem> prob;
        try {
            prob = problems.load(submit.problem_id);
        } catch (problem_not_found &ex) {
            fault(result, fault_reason::PROBLEM_UNAVAILABLE, ex.what());
            return finish_submission();
        } catch (problem_corrupt &ex) {
            fault(result, fault_reason::PROBLEM_UNAVAILABLE, ex.what());
            return finish_submission();
        }

        for (size_t i = 0; i < prob->tests.size(); ++i) {
            test_trace trace;
            trace.index = i;
            result.tests.push_back(trace);
        }

        shared_ptr<const toolchain> tc;
        try {
            tc = toolchains.resolve(submit.toolchain_id);
        } catch (toolchain_not_found &ex) {
            fault(result, fault_reason::TOOLCHAIN_UNAVAILABLE, ex.what());
            return finish_submission();
        }

        transition(pipeline_state::COMPILING);
        run_outcome compiled;
        try {
            compiled = compile(*tc);
        } catch (infrastructure_error &ex) {
            fault(result, fault_reason::COMPILE_INFRASTRUCTURE, ex.what());
            return finish_submission();
        }
        result.compile_log = compiled.compile_log;

        if (compiled.verdict == status::COMPILE_ERROR) {
            LOG(INFO) << "Submission " << submit.id << " failed to compile";
            result.verdict = status::COMPILE_ERROR;
            transition(pipeline_state::COMPILE_FAILED);
            return finish_submission();
        }
        if (!compiled.artifact) {
            fault(result, fault_reason::COMPILE_INFRASTRUCTURE, "compilation succeeded without producing an artifact");
            return finish_submission();
        }

        transition(pipeline_state::JUDGING);
        valuer_engine engine(*prob);
        valuer_action action = engine.begin();
        while (auto request = get_if<run_tests>(&action)) {
            DLOG(INFO) << "Submission " << submit.id << " running batch of " << request->indices.size() << " tests";
            outcome_map outcomes = run_batch(*prob, *tc, *compiled.artifact, request->indices);
            for (auto &[index, outcome] : outcomes) {
                result.tests[index].disposition = test_disposition::EXECUTED;
                result.tests[index].outcome = outcome;
            }
            call_monitor([&](monitor &m) { m.batch_finished(submit, request->indices, outcomes); });

            action = engine.next(outcomes);
            score live = engine.current_score();
            call_monitor([&](monitor &m) { m.live_score(submit, live); });
        }

        // valuer 已经结束，不再需要任何执行中的任务
        cancel_in_flight();

        for (size_t index : engine.skipped())
            result.tests[index].disposition = test_disposition::SKIPPED;

        auto &decision = get<finish>(action);
        result.verdict = decision.verdict;
        result.final_score = decision.result;
        transition(pipeline_state::SCORED);
        return finish_submission();
    } catch (deadline_exceeded &ex) {
        fault(result, fault_reason::DEADLINE_EXCEEDED, ex.what());
    } catch (invariant_violation &ex) {
        LOG(ERROR) << "Submission " << submit.id << " broke a judging invariant: " << ex;
        call_monitor([&](monitor &m) { m.report_error("Submission " + submit.id + ": " + ex.what()); });
        fault(result, fault_reason::INVARIANT_VIOLATION, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Submission " << submit.id << " crashed: " << boost::diagnostic_information(ex);
        call_monitor([&](monitor &m) { m.report_error("Submission " + submit.id + ": " + ex.what()); });
        fault(result, fault_reason::INTERNAL_ERROR, ex.what());
    }
    return finish_submission();
}

}  // namespace arbiter
