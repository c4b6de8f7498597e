#include "server/judge_service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/defer.hpp"

namespace arbiter::server {
using namespace std;

judge_service::state_tracker::state_tracker(judge_service &service) : service(service) {}

void judge_service::state_tracker::state_changed(const submission &submit, pipeline_state state) {
    scoped_lock guard(service.mut);
    auto it = service.jobs.find(submit.id);
    if (it != service.jobs.end()) it->second.state = state;
}

judge_service::judge_service(problem_repository &problems,
                             toolchain_repository &toolchains,
                             executor::executor_client &executor,
                             pipeline_settings settings,
                             size_t workers)
    : problems(problems), toolchains(toolchains), executor(executor), settings(move(settings)), worker_count(max<size_t>(workers, 1)), tracker(*this) {}

judge_service::~judge_service() {
    stop();
}

void judge_service::register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void judge_service::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &m : monitors) callback(*m);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

void judge_service::start() {
    LOG(INFO) << "Starting " << worker_count << " judge workers";
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop((int)i); });
}

string judge_service::enqueue(submission submit) {
    if (submit.id.empty()) {
        static mutex gen_mut;
        static boost::uuids::random_generator gen;
        scoped_lock guard(gen_mut);
        submit.id = boost::uuids::to_string(gen());
    }

    string id = submit.id;
    {
        // worker 在持有 mut 时判断是否退出，检查 stopping 和入队都必须在锁内完成
        scoped_lock guard(mut);
        if (stopping)
            throw logic_error("judge service has been stopped");
        if (jobs.count(id))
            throw invalid_argument("duplicate submission " + id);
        jobs[id] = job{move(submit), pipeline_state::QUEUED, nullopt, 0};
        queue.push(id);
    }
    LOG(INFO) << "Submission " << id << " queued";
    return id;
}

pipeline_state judge_service::status(const string &id) const {
    scoped_lock guard(mut);
    return jobs.at(id).state;
}

judge_result judge_service::wait(const string &id) {
    unique_lock lock(mut);
    auto it = jobs.find(id);
    if (it == jobs.end())
        throw out_of_range("unknown submission " + id);

    ++it->second.waiters;
    job_finished.wait(lock, [&] { return it->second.result.has_value(); });
    judge_result result = *it->second.result;
    if (--it->second.waiters == 0)
        jobs.erase(it);
    return result;
}

void judge_service::request_stop() {
    stopping = true;
}

void judge_service::stop() {
    request_stop();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();

    {
        scoped_lock guard(mut);
        for (auto &[id, j] : jobs) {
            if (j.result) continue;
            LOG(WARNING) << "Submission " << id << " was not judged before the judge service stopped";
            judge_result result;
            result.submission_id = id;
            result.state = pipeline_state::FAULTED;
            result.verdict = arbiter::status::JUDGE_FAULT;
            result.reason = fault_reason::SERVICE_STOPPED;
            result.message = "judge service stopped before the submission was judged";
            j.state = result.state;
            j.result = move(result);
        }
    }
    job_finished.notify_all();
}

void judge_service::worker_loop(int worker_id) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    vector<monitor *> pipeline_monitors = {&tracker};
    for (auto &m : monitors) pipeline_monitors.push_back(m.get());

    while (true) {
        string id;
        if (!queue.try_pop_for(id, chrono::milliseconds(10))) {
            // 如果需要停止 worker，在评测队列为空时自然退出 worker。
            // enqueue 在持有 mut 时入队，这里持有 mut 再检查一次队列，不会遗漏提交
            scoped_lock guard(mut);
            if (!stopping) continue;
            if (!queue.try_pop(id)) break;
        }

        submission submit;
        {
            scoped_lock guard(mut);
            submit = jobs.at(id).submit;
        }

        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });
        defer {
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
        };

        judge_result result;
        try {
            judge_pipeline pipeline(submit, problems, toolchains, executor, settings, pipeline_monitors);
            result = pipeline.run();
        } catch (std::exception &ex) {
            // 流水线本身不会抛出异常，这里只可能是内存不足、线程无法创建等系统错误
            LOG(ERROR) << "Worker " << worker_id << " failed to judge submission " << id << ": " << boost::diagnostic_information(ex);
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what()); });
            result.submission_id = id;
            result.state = pipeline_state::FAULTED;
            result.verdict = arbiter::status::JUDGE_FAULT;
            result.reason = fault_reason::INTERNAL_ERROR;
            result.message = ex.what();
        }

        {
            scoped_lock guard(mut);
            auto &j = jobs.at(id);
            j.state = result.state;
            j.result = move(result);
        }
        job_finished.notify_all();
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

}  // namespace arbiter::server
