#include "test/fixtures.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/io_utils.hpp"

namespace arbiter::test {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

temp_directory::temp_directory() {
    boost::uuids::random_generator gen;
    dir = fs::temp_directory_path() / ("arbiter-test-" + boost::uuids::to_string(gen()));
    fs::create_directories(dir);
}

temp_directory::~temp_directory() {
    error_code ec;
    fs::remove_all(dir, ec);
}

const fs::path &temp_directory::path() const {
    return dir;
}

static void touch(const fs::path &root, const json &ref, const string &content) {
    if (!ref.is_string()) return;
    string name = ref.get<string>();
    if (name.empty() || name.front() == '/') return;
    fs::path file = root / name;
    if (!fs::exists(file)) write_file_content(file, content);
}

void write_problem(const fs::path &problems_dir, const string &problem_id, const json &manifest) {
    fs::path root = problems_dir / problem_id;
    fs::create_directories(root);
    if (manifest.count("tests") && manifest.at("tests").is_array()) {
        for (auto &test : manifest.at("tests")) {
            if (test.count("input")) touch(root, test.at("input"), "1 2\n");
            if (test.count("answer")) touch(root, test.at("answer"), "3\n");
        }
    }
    if (manifest.count("checker") && manifest.at("checker").count("exe"))
        touch(root, manifest.at("checker").at("exe"), "#!/bin/sh\necho 'outcome: Ok' > $JJS_CHECKER_OUT\n");
    write_file_content(root / "manifest.json", manifest.dump(4));
}

json make_manifest(size_t test_count, const string &mode) {
    json tests = json::array();
    for (size_t i = 0; i < test_count; ++i)
        tests.push_back({{"input", "tests/" + to_string(i) + ".in"},
                         {"answer", "tests/" + to_string(i) + ".out"}});
    return {{"title", "A + B"},
            {"limits", {{"time", 1000}, {"memory", 268435456}}},
            {"tests", tests},
            {"checker", {{"exe", "checker"}}},
            {"valuer", {{"mode", mode}}}};
}

void write_toolchain(const fs::path &toolchains_dir, const string &name) {
    json manifest = {
        {"name", name},
        {"title", "GNU C++ 17"},
        {"filename", "main.cpp"},
        {"build", {{{"argv", {"/usr/bin/g++", "-std=c++17", "$(Run.SourceFilePath)", "-o", "$(Run.BinaryFilePath)"}}}}},
        {"run", {{"argv", {"$(Run.BinaryFilePath)"}}}},
        {"env", {{"PATH", "/usr/bin:/bin"}}}};
    write_file_content(toolchains_dir / name / "manifest.json", manifest.dump(4));
    write_file_content(toolchains_dir / name / "image.txt", "gcc:10\n");
}

}  // namespace arbiter::test
