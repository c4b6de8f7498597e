#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "executor/http_executor_client.hpp"
#include "monitor/log_monitor.hpp"
#include "server/judge_service.hpp"
using namespace std;

static arbiter::server::judge_service *service = nullptr;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    if (service) service->request_stop();
}

/**
 * @brief 读取批量评测文件
 * [{"id": "1", "problem": "a-plus-b", "toolchain": "cpp", "source_file": "a.cpp"}, ...]
 * source_file 相对于批量评测文件所在的文件夹，也可以直接用 source 给出代码
 */
static vector<arbiter::submission> read_batch(const filesystem::path &path) {
    vector<arbiter::submission> submissions;
    nlohmann::json batch = nlohmann::json::parse(arbiter::read_file_content(path));
    for (auto &item : batch) {
        arbiter::submission submit;
        if (item.count("id")) item.at("id").get_to(submit.id);
        item.at("problem").get_to(submit.problem_id);
        item.at("toolchain").get_to(submit.toolchain_id);
        if (item.count("source"))
            item.at("source").get_to(submit.source);
        else
            submit.source = arbiter::read_file_content(path.parent_path() / item.at("source_file").get<string>());
        submissions.push_back(move(submit));
    }
    return submissions;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arbiter options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load judge settings from the given JSON file")
        ("problems-dir", po::value<string>(), "set the directory of problem packages. You can either pass it from environ PROBLEMSDIR")
        ("toolchains-dir", po::value<string>(), "set the directory of toolchains. You can either pass it from environ TOOLCHAINSDIR")
        ("executor", po::value<string>(), "set the address of the executor, e.g. http://localhost:8000. You can either pass it from environ EXECUTOR")
        ("checker-logs-dir", po::value<string>(), "save checker output of every test into this directory")
        ("parallel-tests", po::value<size_t>(), "set the maximum number of tests of one submission judged concurrently, default to 4")
        ("max-judging", po::value<size_t>(), "set the maximum number of submissions judged concurrently, default to 2")
        ("retry-attempts", po::value<unsigned>(), "set the maximum attempts of a job failed because of executor errors, default to 3")
        ("deadline", po::value<long long>(), "set the time budget in milliseconds of one submission, default to 300000")
        ("problem", po::value<string>(), "judge a single submission of this problem")
        ("toolchain", po::value<string>(), "toolchain of the single submission")
        ("source", po::value<string>(), "source file of the single submission")
        ("id", po::value<string>(), "id of the single submission")
        ("batch", po::value<string>(), "judge all submissions listed in the given JSON file")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "arbiter: compile submissions and judge them on a remote executor" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arbiter 1.0" << endl;
        return EXIT_SUCCESS;
    }

    arbiter::judge_settings settings;
    if (vm.count("config")) {
        string config = vm.at("config").as<string>();
        CHECK(filesystem::is_regular_file(config))
            << "Configuration file " << config << " does not exist";
        try {
            nlohmann::json::parse(arbiter::read_file_content(config)).get_to(settings);
        } catch (std::exception &e) {
            LOG(FATAL) << "Configuration file " << config << " is malformed: " << e.what();
        }
    }

    if (vm.count("problems-dir")) {
        settings.problems_dir = vm.at("problems-dir").as<string>();
    } else if (getenv("PROBLEMSDIR")) {
        settings.problems_dir = getenv("PROBLEMSDIR");
    }
    CHECK(filesystem::is_directory(settings.problems_dir))
        << "Problems directory " << settings.problems_dir << " does not exist";

    if (vm.count("toolchains-dir")) {
        settings.toolchains_dir = vm.at("toolchains-dir").as<string>();
    } else if (getenv("TOOLCHAINSDIR")) {
        settings.toolchains_dir = getenv("TOOLCHAINSDIR");
    }
    CHECK(filesystem::is_directory(settings.toolchains_dir))
        << "Toolchains directory " << settings.toolchains_dir << " does not exist";

    if (vm.count("executor")) {
        settings.executor_address = vm.at("executor").as<string>();
    } else if (getenv("EXECUTOR")) {
        settings.executor_address = getenv("EXECUTOR");
    }

    if (vm.count("checker-logs-dir"))
        settings.checker_logs_dir = filesystem::path(vm.at("checker-logs-dir").as<string>());
    if (vm.count("parallel-tests"))
        settings.max_parallel_tests = vm.at("parallel-tests").as<size_t>();
    if (vm.count("max-judging"))
        settings.max_judging = vm.at("max-judging").as<size_t>();
    if (vm.count("retry-attempts"))
        settings.retry.max_attempts = vm.at("retry-attempts").as<unsigned>();
    if (vm.count("deadline"))
        settings.deadline = chrono::milliseconds(vm.at("deadline").as<long long>());

    vector<arbiter::submission> submissions;
    try {
        if (vm.count("batch")) {
            submissions = read_batch(vm.at("batch").as<string>());
        } else if (vm.count("problem") && vm.count("toolchain") && vm.count("source")) {
            arbiter::submission submit;
            if (vm.count("id")) submit.id = vm.at("id").as<string>();
            submit.problem_id = vm.at("problem").as<string>();
            submit.toolchain_id = vm.at("toolchain").as<string>();
            submit.source = arbiter::read_file_content(vm.at("source").as<string>());
            submissions.push_back(move(submit));
        } else {
            cerr << "Either --batch or --problem, --toolchain and --source should be specified" << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to read submissions: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    arbiter::problem_repository problems(settings.problems_dir);
    arbiter::toolchain_repository toolchains(settings.toolchains_dir);
    arbiter::executor::http_executor_client executor(settings.executor_address, settings.executor_timeout);

    arbiter::server::judge_service judge_service(problems, toolchains, executor, settings.get_pipeline_settings(), settings.max_judging);
    judge_service.register_monitor(make_unique<arbiter::log_monitor>());
    service = &judge_service;
    signal(SIGINT, sigintHandler);
    judge_service.start();

    vector<string> ids;
    try {
        for (auto &submit : submissions)
            ids.push_back(judge_service.enqueue(move(submit)));
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to enqueue submission: " << e.what();
    }

    bool all_scored = true;
    for (auto &id : ids) {
        arbiter::judge_result result = judge_service.wait(id);
        if (result.state == arbiter::pipeline_state::FAULTED) all_scored = false;
        cout << nlohmann::json(result).dump() << endl;
    }

    judge_service.stop();
    service = nullptr;
    return all_scored ? EXIT_SUCCESS : EXIT_FAILURE;
}
