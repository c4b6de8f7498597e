#include "executor/http_executor_client.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <glog/logging.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arbiter::executor {
using namespace std;
using namespace nlohmann;

static once_flag curl_init_flag;
static constexpr chrono::milliseconds CANCEL_POLL_INTERVAL(50);

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static int check_cancelled(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    // 非零返回值使 curl 中断传输
    return static_cast<const atomic<bool> *>(clientp)->load() ? 1 : 0;
}

static string generate_job_id() {
    static mutex gen_mut;
    static boost::uuids::random_generator gen;
    scoped_lock guard(gen_mut);
    return boost::uuids::to_string(gen());
}

http_executor_client::http_executor_client(const string &address, chrono::milliseconds request_timeout)
    : address(address), request_timeout(request_timeout) {
    call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    while (!this->address.empty() && this->address.back() == '/')
        this->address.pop_back();
}

http_executor_client::~http_executor_client() {
    vector<shared_future<run_outcome>> pending;
    {
        scoped_lock guard(mut);
        for (auto &[id, job] : jobs) {
            job.cancelled->store(true);
            pending.push_back(job.result);
        }
        jobs.clear();
        for (auto &f : abandoned) pending.push_back(f);
        abandoned.clear();
    }
    for (auto &f : pending)
        if (f.valid()) f.wait();
}

json http_executor_client::post(const json &body, const atomic<bool> &cancelled) const {
    CURL *curl = curl_easy_init();
    if (!curl) throw infrastructure_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    string url = address + "/exec";
    string payload = body.dump();
    string response;

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    defer { curl_slist_free_all(headers); };

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)payload.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)request_timeout.count());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancelled);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancelled);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_ABORTED_BY_CALLBACK)
        throw infrastructure_error("request to " + url + " was cancelled");
    if (res != CURLE_OK)
        throw infrastructure_error("request to " + url + " failed: " + curl_easy_strerror(res));

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    if (code < 200 || code >= 300)
        throw infrastructure_error("executor returned HTTP " + to_string(code) + ": " + response);

    try {
        return json::parse(response);
    } catch (json::exception &ex) {
        throw infrastructure_error(string("executor returned malformed response: ") + ex.what());
    }
}

void http_executor_client::send_cancel(const string &id) const {
    CURL *curl = curl_easy_init();
    if (!curl) return;
    defer { curl_easy_cleanup(curl); };

    string url = address + "/exec/" + id;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 1000L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    string ignored;
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ignored);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        LOG(WARNING) << "Unable to notify executor to cancel job " << id << ": " << curl_easy_strerror(res);
}

job_handle http_executor_client::start_job(job_kind kind, size_t test_index, function<run_outcome(const string &, const atomic<bool> &)> task) {
    reap_abandoned();

    job_handle handle;
    handle.id = generate_job_id();
    handle.kind = kind;
    handle.test_index = test_index;

    auto cancelled = make_shared<atomic<bool>>(false);
    string id = handle.id;
    auto result = async(launch::async, [task = move(task), id, cancelled] {
                      try {
                          return task(id, *cancelled);
                      } catch (json::exception &ex) {
                          throw infrastructure_error(string("executor returned malformed response: ") + ex.what());
                      }
                  }).share();

    scoped_lock guard(mut);
    jobs[handle.id] = job{cancelled, move(result)};
    return handle;
}

job_handle http_executor_client::submit_compile(const toolchain &tc, const string &source) {
    return start_job(job_kind::COMPILE, 0, [this, tc, source](const string &id, const atomic<bool> &cancelled) {
        invoke_request request = build_compile_request(id, tc, source);
        DLOG(INFO) << "Sending compile request " << id << " with toolchain " << tc.name;
        return interpret_compile_response(request, tc, post(request.body, cancelled));
    });
}

job_handle http_executor_client::submit_run(const toolchain &tc, const compiled_artifact &artifact, const test_input &input, const resource_limits &limits) {
    // 测试数据在提交时读取，读取失败即视为提交失败
    invoke_request request;
    try {
        request = build_run_request("", tc, artifact, input, limits);
    } catch (system_error &ex) {
        throw infrastructure_error(string("unable to read test data: ") + ex.what());
    }

    return start_job(job_kind::RUN_TEST, input.index, [this, request, limits](const string &id, const atomic<bool> &cancelled) mutable {
        request.body["id"] = id;
        return interpret_run_response(request, limits, post(request.body, cancelled));
    });
}

run_outcome http_executor_client::await_result(const job_handle &handle, chrono::steady_clock::time_point deadline) {
    shared_future<run_outcome> result;
    shared_ptr<atomic<bool>> cancelled;
    {
        scoped_lock guard(mut);
        auto it = jobs.find(handle.id);
        if (it == jobs.end())
            throw infrastructure_error("unknown job " + handle.id);
        result = it->second.result;
        cancelled = it->second.cancelled;
    }

    // curl 只在进度回调中检查取消标记，这里分段等待以便及时响应 cancel
    while (true) {
        chrono::steady_clock::time_point poll = chrono::steady_clock::now() + CANCEL_POLL_INTERVAL;
        if (result.wait_until(min(deadline, poll)) == future_status::ready) break;
        if (cancelled->load())
            throw job_cancelled(handle.id);
        if (chrono::steady_clock::now() >= deadline)
            throw deadline_exceeded("job " + handle.id + " did not finish before deadline");
    }
    if (cancelled->load())
        throw job_cancelled(handle.id);

    {
        scoped_lock guard(mut);
        jobs.erase(handle.id);
    }
    return result.get();
}

void http_executor_client::cancel(const job_handle &handle) {
    {
        scoped_lock guard(mut);
        auto it = jobs.find(handle.id);
        if (it == jobs.end()) return;
        it->second.cancelled->store(true);
        abandoned.push_back(it->second.result);
        jobs.erase(it);
    }
    LOG(INFO) << "Cancelling job " << handle.id;
    send_cancel(handle.id);
}

void http_executor_client::reap_abandoned() {
    scoped_lock guard(mut);
    abandoned.erase(remove_if(abandoned.begin(), abandoned.end(), [](const shared_future<run_outcome> &f) {
                        return f.wait_for(chrono::seconds(0)) == future_status::ready;
                    }),
                    abandoned.end());
}

}  // namespace arbiter::executor
