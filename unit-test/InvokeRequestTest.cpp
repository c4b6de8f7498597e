#include <signal.h>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "executor/invoke_request.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace nlohmann;
using namespace arbiter;
using namespace arbiter::executor;
using namespace arbiter::test;

static toolchain make_toolchain() {
    toolchain tc;
    tc.name = "cpp";
    tc.filename = "main.cpp";
    tc.image = "gcc:10";
    command_template build;
    build.argv = {"/usr/bin/g++", "$(Run.SourceFilePath)", "-o", "$(Run.BinaryFilePath)"};
    tc.build.push_back(build);
    tc.run.argv = {"$(Run.BinaryFilePath)"};
    tc.build_limits.time = 10000;
    return tc;
}

static json output(const string &name, const string &data) {
    return {{"name", name}, {"data", {{"InlineBase64", base64_encode(data)}}}};
}

/**
 * @brief 构造执行器响应，每个执行命令的步骤结果按照 results 的顺序给出
 */
static json make_response(const invoke_request &request, const vector<json> &results, const vector<json> &outputs) {
    json actions = json::array();
    for (size_t i = 0; i < request.body.at("steps").size(); ++i) actions.push_back(json::object());
    for (size_t i = 0; i < results.size(); ++i)
        actions[request.command_steps[i]] = {{"ExecuteCommand", results[i]}};
    return {{"actions", actions}, {"outputs", outputs}};
}

static json command_ok() {
    return {{"exit_code", 0}, {"cpu_time", 15000000}, {"memory", 1048576}, {"spawn_error", nullptr}};
}

TEST(Base64Test, EncodesAndDecodes) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_decode("Zm9vYmFy"), "foobar");
    EXPECT_EQ(base64_decode("Zg=="), "f");

    string binary("\x7f" "ELF\0\x01\xff", 7);
    EXPECT_EQ(base64_decode(base64_encode(binary)), binary);
    EXPECT_THROW(base64_decode("Zm9v!"), invalid_argument);
}

TEST(InvokeRequestTest, DescribeCommandResult) {
    resource_limits limits;
    limits.time = 1000;
    limits.memory = 64 * 1024 * 1024;

    EXPECT_EQ(describe_command_result(limits, command_ok()), command_status::OK);
    EXPECT_EQ(describe_command_result(limits, {{"exit_code", 0}, {"cpu_time", 1000000001}}), command_status::TIME_LIMIT);
    EXPECT_EQ(describe_command_result(limits, {{"exit_code", 0}, {"cpu_time", 1000000000}}), command_status::OK);
    EXPECT_EQ(describe_command_result(limits, {{"exit_code", 0}, {"memory", 64 * 1024 * 1024 + 1}}), command_status::MEMORY_LIMIT);
    EXPECT_EQ(describe_command_result(limits, {{"exit_code", -1}, {"signal", SIGSYS}}), command_status::SECURITY_VIOLATION);
    EXPECT_EQ(describe_command_result(limits, {{"exit_code", 1}}), command_status::RUNTIME);
    EXPECT_EQ(describe_command_result(limits, {{"spawn_error", "no such file"}}), command_status::STARTUP);
}

TEST(InvokeRequestTest, MalformedCommandResultIsInfrastructureError) {
    resource_limits limits;
    EXPECT_THROW(describe_command_result(limits, {{"exit_code", nullptr}}), infrastructure_error);
    EXPECT_THROW(describe_command_result(limits, {{"exit_code", "139"}}), infrastructure_error);
    EXPECT_THROW(describe_command_result(limits, {{"exit_code", 0}, {"cpu_time", "fast"}}), infrastructure_error);
    EXPECT_THROW(describe_command_result(limits, {{"exit_code", 0}, {"memory", json::array()}}), infrastructure_error);
    EXPECT_THROW(describe_command_result(limits, {{"exit_code", 0}, {"signal", "SIGSYS"}}), infrastructure_error);
    EXPECT_THROW(describe_command_result(limits, json("ok")), infrastructure_error);
    EXPECT_EQ(describe_command_result(limits, {{"exit_code", 0}, {"signal", nullptr}}), command_status::OK);
}

TEST(InvokeRequestTest, ParseCheckerDecision) {
    EXPECT_EQ(parse_checker_decision("outcome: Ok\n"), status::ACCEPTED);
    EXPECT_EQ(parse_checker_decision("score: 0\noutcome: WrongAnswer\n"), status::WRONG_ANSWER);
    EXPECT_EQ(parse_checker_decision("Outcome:PresentationError"), status::PRESENTATION_ERROR);
    EXPECT_EQ(parse_checker_decision("outcome: BadChecker"), status::JUDGE_FAULT);
    EXPECT_THROW(parse_checker_decision(""), invalid_argument);
    EXPECT_THROW(parse_checker_decision("outcome: Maybe"), invalid_argument);
}

TEST(InvokeRequestTest, CompileRequestCarriesSource) {
    toolchain tc = make_toolchain();
    invoke_request request = build_compile_request("job-1", tc, "int main() {}");

    EXPECT_EQ(request.body.at("id").get<string>(), "job-1");
    ASSERT_EQ(request.command_steps.size(), 1u);
    const json &exec = request.body.at("steps").at(request.command_steps[0]).at("action").at("ExecuteCommand");
    EXPECT_EQ(exec.at("argv").get<vector<string>>(), vector<string>({"/usr/bin/g++", "/compile-input/main.cpp", "-o", "/compile-output/bin"}));
    EXPECT_EQ(exec.at("sandbox_name").get<string>(), "compile-sandbox");

    const json &source = request.body.at("ext").at("extra_files").at("compile-input/main.cpp");
    EXPECT_EQ(base64_decode(source.at("contents").at("InlineBase64").at("data").get<string>()), "int main() {}");
}

TEST(InvokeRequestTest, CompileSucceeded) {
    toolchain tc = make_toolchain();
    invoke_request request = build_compile_request("job-1", tc, "int main() {}");
    json response = make_response(request, {command_ok()},
                                  {output("step-0-stdout", ""), output("step-0-stderr", "warning: unused"), output("artifact", "\x7f" "ELF")});

    run_outcome outcome = interpret_compile_response(request, tc, response);
    EXPECT_EQ(outcome.verdict, status::ACCEPTED);
    ASSERT_TRUE(outcome.artifact);
    EXPECT_EQ(outcome.artifact->binary, "\x7f" "ELF");
    EXPECT_EQ(outcome.compile_log, "------ step 0 ------\n--- stdout ---\n--- stderr ---\nwarning: unused");
}

TEST(InvokeRequestTest, CompileFailed) {
    toolchain tc = make_toolchain();
    invoke_request request = build_compile_request("job-1", tc, "int main() {");
    json failed = {{"exit_code", 1}};
    json response = make_response(request, {failed},
                                  {output("step-0-stdout", ""), output("step-0-stderr", "error: expected '}'")});

    run_outcome outcome = interpret_compile_response(request, tc, response);
    EXPECT_EQ(outcome.verdict, status::COMPILE_ERROR);
    EXPECT_FALSE(outcome.artifact);
    EXPECT_NE(outcome.compile_log.find("error: expected '}'"), string::npos);
}

TEST(InvokeRequestTest, MalformedResponseIsInfrastructureError) {
    toolchain tc = make_toolchain();
    invoke_request request = build_compile_request("job-1", tc, "int main() {}");
    EXPECT_THROW(interpret_compile_response(request, tc, json::object()), infrastructure_error);
    EXPECT_THROW(interpret_compile_response(request, tc, make_response(request, {command_ok()}, {})), infrastructure_error);

    json bad_memory = {{"exit_code", 0}, {"memory", "1M"}};
    EXPECT_THROW(interpret_compile_response(request, tc, make_response(request, {bad_memory}, {output("step-0-stdout", ""), output("step-0-stderr", "")})),
                 infrastructure_error);
}

class RunResponseTest : public ::testing::Test {
protected:
    temp_directory dir;
    toolchain tc = make_toolchain();
    test_input input;
    resource_limits limits;
    invoke_request request;

    void SetUp() override {
        write_file_content(dir.path() / "1.in", "1 2\n");
        write_file_content(dir.path() / "1.out", "3\n");
        write_file_content(dir.path() / "checker", "#!/bin/sh\n");
        input.index = 1;
        input.input = dir.path() / "1.in";
        input.answer = dir.path() / "1.out";
        input.checker.exe = dir.path() / "checker";
        request = build_run_request("job-2", tc, compiled_artifact{"\x7f" "ELF"}, input, limits);
    }

    json respond(const json &solution, const json &checker, const string &decision) {
        return make_response(request, {solution, checker},
                             {output("solution-output", "3\n"), output("solution-error", ""),
                              output("checker-logs", "ok 1 number"), output("checker-decision", decision)});
    }
};

TEST_F(RunResponseTest, RequestReadsTestData) {
    ASSERT_EQ(request.command_steps.size(), 2u);
    const json &inputs = request.body.at("inputs");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(base64_decode(inputs[0].at("source").at("InlineBase64").at("data").get<string>()), "1 2\n");
    EXPECT_EQ(base64_decode(inputs[1].at("source").at("InlineBase64").at("data").get<string>()), "3\n");

    const json &run = request.body.at("steps").at(request.command_steps[0]).at("action").at("ExecuteCommand");
    EXPECT_EQ(run.at("argv").get<vector<string>>(), vector<string>({"/compile-out/bin"}));
    EXPECT_EQ(run.at("stdio").at("stdin").get<string>(), "test-data");
}

TEST_F(RunResponseTest, MissingTestDataThrows) {
    input.input = dir.path() / "missing.in";
    EXPECT_THROW(build_run_request("job-3", tc, compiled_artifact{"bin"}, input, limits), system_error);
}

TEST_F(RunResponseTest, Accepted) {
    run_outcome outcome = interpret_run_response(request, limits, respond(command_ok(), command_ok(), "outcome: Ok\n"));
    EXPECT_EQ(outcome.verdict, status::ACCEPTED);
    EXPECT_EQ(outcome.time, 15u);
    EXPECT_EQ(outcome.memory, 1048576u);
    EXPECT_EQ(outcome.output, "3\n");
    EXPECT_EQ(outcome.checker_log, "ok 1 number");
}

TEST_F(RunResponseTest, WrongAnswer) {
    run_outcome outcome = interpret_run_response(request, limits, respond(command_ok(), command_ok(), "outcome: WrongAnswer\n"));
    EXPECT_EQ(outcome.verdict, status::WRONG_ANSWER);
}

TEST_F(RunResponseTest, SolutionFailuresSkipChecker) {
    json tle = {{"exit_code", 0}, {"cpu_time", 2000000000}};
    EXPECT_EQ(interpret_run_response(request, limits, respond(tle, json(), "")).verdict, status::TIME_LIMIT_EXCEEDED);

    json re = {{"exit_code", 139}};
    EXPECT_EQ(interpret_run_response(request, limits, respond(re, json(), "")).verdict, status::RUNTIME_ERROR);

    json sv = {{"exit_code", -1}, {"signal", SIGSYS}};
    EXPECT_EQ(interpret_run_response(request, limits, respond(sv, json(), "")).verdict, status::SECURITY_VIOLATION);
}

TEST_F(RunResponseTest, SpawnErrorIsInfrastructureError) {
    json spawn = {{"spawn_error", "image not found"}};
    EXPECT_THROW(interpret_run_response(request, limits, respond(spawn, command_ok(), "outcome: Ok")), infrastructure_error);
}

TEST_F(RunResponseTest, MalformedNumbersAreInfrastructureErrors) {
    json null_exit = {{"exit_code", nullptr}, {"cpu_time", 15000000}};
    EXPECT_THROW(interpret_run_response(request, limits, respond(null_exit, command_ok(), "outcome: Ok")), infrastructure_error);

    json string_exit = {{"exit_code", "139"}};
    EXPECT_THROW(interpret_run_response(request, limits, respond(string_exit, command_ok(), "outcome: Ok")), infrastructure_error);

    json string_time = {{"exit_code", 0}, {"cpu_time", "15ms"}};
    EXPECT_THROW(interpret_run_response(request, limits, respond(string_time, command_ok(), "outcome: Ok")), infrastructure_error);

    json checker_exit = {{"exit_code", "0"}};
    EXPECT_THROW(interpret_run_response(request, limits, respond(command_ok(), checker_exit, "outcome: Ok")), infrastructure_error);
}

TEST_F(RunResponseTest, BrokenCheckerIsJudgeFault) {
    EXPECT_EQ(interpret_run_response(request, limits, respond(command_ok(), {{"exit_code", 2}}, "outcome: Ok")).verdict, status::JUDGE_FAULT);
    EXPECT_EQ(interpret_run_response(request, limits, respond(command_ok(), command_ok(), "garbage")).verdict, status::JUDGE_FAULT);
}
