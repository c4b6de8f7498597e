#include <atomic>
#include <thread>
#include "gtest/gtest.h"
#include "monitor/log_monitor.hpp"
#include "server/judge_service.hpp"
#include "test/fixtures.hpp"
#include "test/mock_executor.hpp"

using namespace std;
using namespace nlohmann;
using namespace arbiter;
using namespace arbiter::test;
namespace mock = arbiter::executor::mock;

/**
 * @brief 统计同时处于评测中的提交数
 */
struct concurrency_monitor : public monitor {
    void start_submission(const submission &) override {
        int now = ++judging;
        int prev = peak.load();
        while (prev < now && !peak.compare_exchange_weak(prev, now)) {}
    }

    void end_submission(const submission &, const judge_result &) override {
        --judging;
    }

    atomic<int> judging{0};
    atomic<int> peak{0};
};

class JudgeServiceTest : public ::testing::Test {
protected:
    temp_directory dir;
    mock::scripted_executor executor;
    pipeline_settings settings;
    unique_ptr<problem_repository> problems;
    unique_ptr<toolchain_repository> toolchains;

    void SetUp() override {
        write_toolchain(dir.path() / "toolchains", "cpp");
        write_problem(dir.path() / "problems", "a-plus-b", make_manifest(2));
        problems = make_unique<problem_repository>(dir.path() / "problems");
        toolchains = make_unique<toolchain_repository>(dir.path() / "toolchains");
        settings.retry.initial_backoff = chrono::milliseconds(1);
        settings.deadline = chrono::seconds(30);
    }

    static submission make_submission(const string &id, const string &problem_id = "a-plus-b") {
        return submission{id, problem_id, "cpp", "int main() {}"};
    }
};

TEST_F(JudgeServiceTest, JudgesQueuedSubmissions) {
    server::judge_service service(*problems, *toolchains, executor, settings, 2);
    service.register_monitor(make_unique<log_monitor>());
    service.start();

    string first = service.enqueue(make_submission("1"));
    string second = service.enqueue(make_submission("2", "nothing"));
    EXPECT_EQ(first, "1");

    judge_result result = service.wait(first);
    EXPECT_EQ(result.submission_id, "1");
    EXPECT_EQ(result.state, pipeline_state::SCORED);
    EXPECT_EQ(result.verdict, status::ACCEPTED);

    judge_result faulted = service.wait(second);
    EXPECT_EQ(faulted.state, pipeline_state::FAULTED);
    EXPECT_EQ(faulted.reason, fault_reason::PROBLEM_UNAVAILABLE);

    service.stop();
}

TEST_F(JudgeServiceTest, GeneratesIdAndRejectsDuplicates) {
    server::judge_service service(*problems, *toolchains, executor, settings, 1);

    string id = service.enqueue(make_submission(""));
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(service.status(id), pipeline_state::QUEUED);
    EXPECT_THROW(service.enqueue(make_submission(id)), invalid_argument);
    EXPECT_THROW(service.status("unknown"), out_of_range);

    service.start();
    EXPECT_EQ(service.wait(id).state, pipeline_state::SCORED);
    service.stop();
}

TEST_F(JudgeServiceTest, WorkerCountBoundsConcurrentSubmissions) {
    executor.delay = chrono::milliseconds(20);
    server::judge_service service(*problems, *toolchains, executor, settings, 2);
    auto counter = make_unique<concurrency_monitor>();
    concurrency_monitor &stats = *counter;
    service.register_monitor(move(counter));
    service.start();

    vector<string> ids;
    for (int i = 0; i < 6; ++i)
        ids.push_back(service.enqueue(make_submission("s" + to_string(i))));
    for (auto &id : ids)
        EXPECT_EQ(service.wait(id).state, pipeline_state::SCORED);

    EXPECT_LE(stats.peak.load(), 2);
    EXPECT_GE(stats.peak.load(), 1);
    service.stop();
}

TEST_F(JudgeServiceTest, StopDrainsQueueAndRejectsNewSubmissions) {
    server::judge_service service(*problems, *toolchains, executor, settings, 1);
    service.start();
    string id = service.enqueue(make_submission("last"));
    service.request_stop();

    EXPECT_THROW(service.enqueue(make_submission("late")), logic_error);
    EXPECT_EQ(service.wait(id).state, pipeline_state::SCORED);
    service.stop();
}

TEST_F(JudgeServiceTest, CollectedResultsAreReleased) {
    server::judge_service service(*problems, *toolchains, executor, settings, 1);
    service.start();

    string id = service.enqueue(make_submission("7"));
    EXPECT_EQ(service.wait(id).state, pipeline_state::SCORED);
    EXPECT_THROW(service.status(id), out_of_range);
    EXPECT_THROW(service.wait(id), out_of_range);

    // 结果取走后可以用同一个 id 重新评测
    EXPECT_EQ(service.enqueue(make_submission("7")), "7");
    EXPECT_EQ(service.wait("7").state, pipeline_state::SCORED);
    service.stop();
}

TEST_F(JudgeServiceTest, StopFaultsSubmissionsThatWereNeverJudged) {
    server::judge_service service(*problems, *toolchains, executor, settings, 1);
    string id = service.enqueue(make_submission("orphan"));
    service.stop();

    judge_result result = service.wait(id);
    EXPECT_EQ(result.state, pipeline_state::FAULTED);
    EXPECT_EQ(result.verdict, status::JUDGE_FAULT);
    EXPECT_EQ(result.reason, fault_reason::SERVICE_STOPPED);
    EXPECT_EQ(executor.compile_submissions(), 0u);
}

TEST_F(JudgeServiceTest, AcceptedSubmissionIsJudgedWhenStopRaces) {
    for (int round = 0; round < 20; ++round) {
        server::judge_service service(*problems, *toolchains, executor, settings, 2);
        service.start();

        thread stopper([&] { service.request_stop(); });
        string id;
        try {
            id = service.enqueue(make_submission("race-" + to_string(round)));
        } catch (logic_error &) {
            // 停止标记先于入队，提交被拒绝
        }
        stopper.join();
        service.stop();

        // 只要 enqueue 成功，提交就必须被 worker 评测，而不是在停止时被丢弃
        if (!id.empty())
            EXPECT_EQ(service.wait(id).state, pipeline_state::SCORED) << "round " << round;
    }
}
