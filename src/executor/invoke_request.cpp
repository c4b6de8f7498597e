#include "executor/invoke_request.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace arbiter::executor {
using namespace std;
using namespace nlohmann;

static const char *FILE_ID_EMPTY = "empty";
static const char *COMPILE_SANDBOX_NAME = "compile-sandbox";
static const char *VOLUME_NAME = "work";
static const char *ARTIFACT_OUTPUT = "artifact";

static const char *TEST_DATA_INPUT_FILE = "test-data";
static const char *CORRECT_ANSWER_FILE = "correct";
static const char *EXEC_SOLUTION_OUTPUT_FILE = "solution-output";
static const char *EXEC_SOLUTION_ERROR_FILE = "solution-error";
static const char *CHECKER_DECISION = "checker-decision";
static const char *CHECKER_LOG = "checker-logs";
static const char *SOLUTION_SANDBOX_NAME = "exec-sandbox";
static const char *CHECKER_SANDBOX_NAME = "checker-sandbox";
static const char *CHECKER_IMAGE = "gcr.io/distroless/cc:latest";

static constexpr unsigned PREPARE_STAGE = 0;
static constexpr unsigned EXEC_SOLUTION_STAGE = 1;
static constexpr unsigned EXEC_CHECKER_STAGE = 2;

static json inline_data(const string &data) {
    return {{"InlineBase64", {{"data", base64_encode(data)}}}};
}

static json make_step(unsigned stage, const string &action, json settings) {
    return {{"stage", stage}, {"action", {{action, move(settings)}}}};
}

static json make_limits(const resource_limits &limits) {
    return {{"time", limits.time}, {"memory", limits.memory}, {"process_count", limits.process_count}};
}

static json make_command(const string &sandbox, const command_template &command, const map<string, string> &extra_env,
                         const string &stdin_id, const string &stdout_id, const string &stderr_id) {
    json env = json::array();
    for (auto &[name, value] : extra_env)
        env.push_back({{"name", name}, {"value", {{"Plain", value}}}});
    for (auto &[name, value] : command.env)
        env.push_back({{"name", name}, {"value", {{"Plain", value}}}});
    return {{"sandbox_name", sandbox},
            {"argv", command.argv},
            {"env", env},
            {"cwd", command.cwd},
            {"stdio", {{"stdin", stdin_id}, {"stdout", stdout_id}, {"stderr", stderr_id}}}};
}

static json expose_extra_files(const string &subdir, const string &sandbox_path) {
    return {{"host_path", {{"extra_files", subdir}}},
            {"sandbox_path", sandbox_path},
            {"mode", "ReadOnly"}};
}

static json output_file(const string &id) {
    return {{"name", id}, {"target", {{"File", id}}}};
}

static json empty_request(const string &id) {
    return {{"id", id},
            {"steps", json::array()},
            {"inputs", json::array()},
            {"outputs", json::array()},
            {"ext", {{"extra_files", json::object()}}}};
}

template <typename T>
static T number_field(const json &result, const char *name) {
    if (!result.is_object())
        throw infrastructure_error(fmt::format("malformed command result: {}", result.dump()));
    auto it = result.find(name);
    if (it == result.end()) return T();
    if (!it->is_number())
        throw infrastructure_error(fmt::format("malformed {} in command result: {}", name, it->dump()));
    return it->get<T>();
}

command_status describe_command_result(const resource_limits &limits, const json &result) {
    if (result.is_object() && result.count("spawn_error") && !result.at("spawn_error").is_null())
        return command_status::STARTUP;
    if (number_field<uint64_t>(result, "cpu_time") > limits.time * 1000000)
        return command_status::TIME_LIMIT;
    if (number_field<uint64_t>(result, "memory") > limits.memory)
        return command_status::MEMORY_LIMIT;
    // 正常退出时 signal 为 null
    if (result.count("signal") && !result.at("signal").is_null() && number_field<int>(result, "signal") == SIGSYS)
        return command_status::SECURITY_VIOLATION;
    if (number_field<int64_t>(result, "exit_code") != 0)
        return command_status::RUNTIME;
    return command_status::OK;
}

invoke_request build_compile_request(const string &id, const toolchain &tc, const string &source) {
    invoke_request request;
    json &body = request.body = empty_request(id);

    map<string, string> substitutions;
    substitutions[SOURCE_FILE_PATH_VAR] = "/compile-input/" + tc.filename;
    substitutions[BINARY_FILE_PATH_VAR] = "/compile-output/bin";

    body["ext"]["extra_files"]["compile-input/" + tc.filename] = {
        {"contents", inline_data(source)}, {"executable", false}};

    body["steps"].push_back(make_step(PREPARE_STAGE, "OpenNullFile", {{"id", FILE_ID_EMPTY}}));
    body["steps"].push_back(make_step(PREPARE_STAGE, "CreateVolume", {{"name", VOLUME_NAME}, {"limit", nullptr}}));
    body["steps"].push_back(make_step(PREPARE_STAGE, "CreateSandbox",
                                      {{"name", COMPILE_SANDBOX_NAME},
                                       {"limits", make_limits(tc.build_limits)},
                                       {"image", tc.image},
                                       {"expose", {expose_extra_files("compile-input", "/compile-input"),
                                                   {{"host_path", {{"volume", VOLUME_NAME}}},
                                                    {"sandbox_path", "/compile-output"},
                                                    {"mode", "ReadWrite"}}}}}));

    for (size_t i = 0; i < tc.build.size(); ++i) {
        string stdout_id = fmt::format("step-{}-stdout", i);
        string stderr_id = fmt::format("step-{}-stderr", i);
        unsigned stage = (unsigned)i;
        body["steps"].push_back(make_step(stage, "CreateFile", {{"id", stdout_id}, {"readable", true}, {"writeable", true}}));
        body["steps"].push_back(make_step(stage, "CreateFile", {{"id", stderr_id}, {"readable", true}, {"writeable", true}}));

        request.command_steps.push_back(body["steps"].size());
        command_template command = tc.build[i].expand(substitutions);
        body["steps"].push_back(make_step(stage, "ExecuteCommand",
                                          make_command(COMPILE_SANDBOX_NAME, command, tc.env, FILE_ID_EMPTY, stdout_id, stderr_id)));

        body["outputs"].push_back(output_file(stdout_id));
        body["outputs"].push_back(output_file(stderr_id));
    }

    body["outputs"].push_back({{"name", ARTIFACT_OUTPUT},
                               {"target", {{"Path", {{"volume", VOLUME_NAME}, {"path", "bin"}}}}}});
    return request;
}

invoke_request build_run_request(const string &id, const toolchain &tc, const compiled_artifact &artifact, const test_input &input, const resource_limits &limits) {
    invoke_request request;
    json &body = request.body = empty_request(id);

    map<string, string> substitutions;
    substitutions[BINARY_FILE_PATH_VAR] = "/compile-out/bin";

    body["ext"]["extra_files"]["compile-out/bin"] = {
        {"contents", inline_data(artifact.binary)}, {"executable", true}};
    body["ext"]["extra_files"]["check/checker"] = {
        {"contents", inline_data(read_file_content(input.checker.exe))}, {"executable", true}};

    body["inputs"].push_back({{"file_id", TEST_DATA_INPUT_FILE}, {"source", inline_data(read_file_content(input.input))}});
    if (input.answer)
        body["inputs"].push_back({{"file_id", CORRECT_ANSWER_FILE}, {"source", inline_data(read_file_content(*input.answer))}});

    body["steps"].push_back(make_step(PREPARE_STAGE, "OpenNullFile", {{"id", FILE_ID_EMPTY}}));

    // 选手程序
    body["steps"].push_back(make_step(EXEC_SOLUTION_STAGE, "CreateFile", {{"id", EXEC_SOLUTION_OUTPUT_FILE}, {"readable", true}, {"writeable", true}}));
    body["steps"].push_back(make_step(EXEC_SOLUTION_STAGE, "CreateFile", {{"id", EXEC_SOLUTION_ERROR_FILE}, {"readable", true}, {"writeable", true}}));
    body["steps"].push_back(make_step(EXEC_SOLUTION_STAGE, "CreateSandbox",
                                      {{"name", SOLUTION_SANDBOX_NAME},
                                       {"limits", make_limits(limits)},
                                       {"image", tc.image},
                                       {"expose", {expose_extra_files("compile-out", "/compile-out")}}}));
    request.command_steps.push_back(body["steps"].size());
    body["steps"].push_back(make_step(EXEC_SOLUTION_STAGE, "ExecuteCommand",
                                      make_command(SOLUTION_SANDBOX_NAME, tc.run.expand(substitutions), tc.env,
                                                   TEST_DATA_INPUT_FILE, EXEC_SOLUTION_OUTPUT_FILE, EXEC_SOLUTION_ERROR_FILE)));

    // 比较器
    body["steps"].push_back(make_step(EXEC_CHECKER_STAGE, "CreateFile", {{"id", CHECKER_DECISION}, {"readable", true}, {"writeable", true}}));
    body["steps"].push_back(make_step(EXEC_CHECKER_STAGE, "CreateFile", {{"id", CHECKER_LOG}, {"readable", true}, {"writeable", true}}));
    body["steps"].push_back(make_step(EXEC_CHECKER_STAGE, "CreateSandbox",
                                      {{"name", CHECKER_SANDBOX_NAME},
                                       {"limits", make_limits(limits)},
                                       {"image", CHECKER_IMAGE},
                                       {"expose", {expose_extra_files("check", "/check")}}}));

    command_template checker;
    checker.argv.push_back("/check/checker");
    checker.argv.insert(checker.argv.end(), input.checker.args.begin(), input.checker.args.end());
    checker.cwd = "/";

    json checker_cmd = make_command(CHECKER_SANDBOX_NAME, checker, {}, FILE_ID_EMPTY, CHECKER_LOG, CHECKER_LOG);
    checker_cmd["env"].push_back({{"name", "JJS_SOL"}, {"value", {{"File", EXEC_SOLUTION_OUTPUT_FILE}}}});
    checker_cmd["env"].push_back({{"name", "JJS_TEST"}, {"value", {{"File", TEST_DATA_INPUT_FILE}}}});
    checker_cmd["env"].push_back({{"name", "JJS_CHECKER_OUT"}, {"value", {{"File", CHECKER_DECISION}}}});
    checker_cmd["env"].push_back({{"name", "JJS_CHECKER_COMMENT"}, {"value", {{"File", CHECKER_LOG}}}});
    if (input.answer)
        checker_cmd["env"].push_back({{"name", "JJS_CORR"}, {"value", {{"File", CORRECT_ANSWER_FILE}}}});
    request.command_steps.push_back(body["steps"].size());
    body["steps"].push_back(make_step(EXEC_CHECKER_STAGE, "ExecuteCommand", checker_cmd));

    body["outputs"].push_back(output_file(CHECKER_LOG));
    body["outputs"].push_back(output_file(CHECKER_DECISION));
    body["outputs"].push_back(output_file(EXEC_SOLUTION_OUTPUT_FILE));
    body["outputs"].push_back(output_file(EXEC_SOLUTION_ERROR_FILE));
    return request;
}

static const json &command_result(const json &response, size_t step) {
    if (!response.count("actions") || !response.at("actions").is_array() || step >= response.at("actions").size())
        throw infrastructure_error(fmt::format("executor response has no result for step {}", step));
    const json &action = response.at("actions").at(step);
    if (!action.is_object() || !action.count("ExecuteCommand"))
        throw infrastructure_error(fmt::format("unexpected action result for step {}", step));
    return action.at("ExecuteCommand");
}

static string read_output(const json &response, const string &name) {
    if (response.count("outputs") && response.at("outputs").is_array()) {
        for (auto &output : response.at("outputs")) {
            if (!output.is_object() || !output.count("name") || output.at("name") != name) continue;
            try {
                return base64_decode(output.at("data").at("InlineBase64").get<string>());
            } catch (json::exception &ex) {
                throw infrastructure_error(fmt::format("malformed output {}: {}", name, ex.what()));
            } catch (invalid_argument &ex) {
                throw infrastructure_error(fmt::format("malformed output {}: {}", name, ex.what()));
            }
        }
    }
    throw infrastructure_error(fmt::format("output {} not found", name));
}

run_outcome interpret_compile_response(const invoke_request &request, const toolchain &tc, const json &response) {
    run_outcome outcome;
    for (size_t step_no = 0; step_no < request.command_steps.size(); ++step_no) {
        const json &data = command_result(response, request.command_steps[step_no]);
        outcome.compile_log += fmt::format("------ step {} ------\n", step_no);
        outcome.compile_log += "--- stdout ---\n";
        outcome.compile_log += read_output(response, fmt::format("step-{}-stdout", step_no));
        outcome.compile_log += "--- stderr ---\n";
        outcome.compile_log += read_output(response, fmt::format("step-{}-stderr", step_no));

        outcome.time += number_field<uint64_t>(data, "cpu_time") / 1000000;
        outcome.memory = max(outcome.memory, number_field<uint64_t>(data, "memory"));

        if (describe_command_result(tc.build_limits, data) != command_status::OK) {
            outcome.verdict = status::COMPILE_ERROR;
            return outcome;
        }
    }

    outcome.verdict = status::ACCEPTED;
    outcome.artifact = compiled_artifact{read_output(response, ARTIFACT_OUTPUT)};
    return outcome;
}

status parse_checker_decision(const string &decision) {
    vector<string> lines;
    boost::split(lines, decision, boost::is_any_of("\n"));
    for (auto &line : lines) {
        auto pos = line.find(':');
        if (pos == string::npos) continue;
        string key = boost::trim_copy(line.substr(0, pos));
        string value = boost::trim_copy(line.substr(pos + 1));
        if (!boost::iequals(key, "outcome")) continue;

        if (value == "Ok") return status::ACCEPTED;
        if (value == "WrongAnswer") return status::WRONG_ANSWER;
        if (value == "PresentationError") return status::PRESENTATION_ERROR;
        if (value == "BadChecker") return status::JUDGE_FAULT;
        throw invalid_argument("unknown checker outcome " + value);
    }
    throw invalid_argument("checker decision has no outcome");
}

run_outcome interpret_run_response(const invoke_request &request, const resource_limits &limits, const json &response) {
    if (request.command_steps.size() != 2)
        throw invalid_argument("run request must have solution and checker steps");

    run_outcome outcome;
    const json &solution = command_result(response, request.command_steps[0]);
    outcome.time = number_field<uint64_t>(solution, "cpu_time") / 1000000;
    outcome.memory = number_field<uint64_t>(solution, "memory");
    outcome.output = read_output(response, EXEC_SOLUTION_OUTPUT_FILE);
    outcome.error_output = read_output(response, EXEC_SOLUTION_ERROR_FILE);
    outcome.checker_log = read_output(response, CHECKER_LOG);

    switch (describe_command_result(limits, solution)) {
        case command_status::STARTUP:
            throw infrastructure_error("sandbox failed to start solution: " + solution.at("spawn_error").dump());
        case command_status::TIME_LIMIT:
            outcome.verdict = status::TIME_LIMIT_EXCEEDED;
            return outcome;
        case command_status::MEMORY_LIMIT:
            outcome.verdict = status::MEMORY_LIMIT_EXCEEDED;
            return outcome;
        case command_status::SECURITY_VIOLATION:
            outcome.verdict = status::SECURITY_VIOLATION;
            return outcome;
        case command_status::RUNTIME:
            outcome.verdict = status::RUNTIME_ERROR;
            return outcome;
        case command_status::OK:
            break;
    }

    const json &checker = command_result(response, request.command_steps[1]);
    bool spawned = !checker.is_object() || !checker.count("spawn_error") || checker.at("spawn_error").is_null();
    if (!spawned || number_field<int64_t>(checker, "exit_code") != 0) {
        LOG(ERROR) << "Checker returned non-zero: " << checker.dump();
        outcome.verdict = status::JUDGE_FAULT;
        return outcome;
    }

    try {
        outcome.verdict = parse_checker_decision(read_output(response, CHECKER_DECISION));
    } catch (invalid_argument &ex) {
        LOG(ERROR) << "Checker output couldn't be parsed: " << ex.what();
        outcome.verdict = status::JUDGE_FAULT;
    }
    return outcome;
}

}  // namespace arbiter::executor
