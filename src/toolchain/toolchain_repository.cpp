#include "toolchain/toolchain_repository.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

toolchain_repository::toolchain_repository(const fs::path &toolchains_dir)
    : toolchains_dir(toolchains_dir),
      cache([this](const string &toolchain_id) { return read(toolchain_id); }) {}

shared_ptr<const toolchain> toolchain_repository::resolve(const string &toolchain_id) {
    return cache.get(toolchain_id);
}

static command_template parse_command(const json &j) {
    command_template command;
    command.argv = get_value<vector<string>>(j, "argv");
    if (command.argv.empty())
        throw invalid_argument("command argv is empty");
    command.env = get_value_def<map<string, string>>(j, {}, "env");
    command.cwd = get_value_def<string>(j, "/jjs", "cwd");
    return command;
}

toolchain parse_toolchain(const json &manifest) {
    toolchain result;
    result.name = get_value<string>(manifest, "name");
    result.title = get_value_def<string>(manifest, result.name, "title");
    result.filename = get_value<string>(manifest, "filename");
    for (auto &command : access(manifest, "build"))
        result.build.push_back(parse_command(command));
    result.run = parse_command(access(manifest, "run"));
    result.env = get_value_def<map<string, string>>(manifest, {}, "env");

    if (exists(manifest, "build_limits")) {
        const json &limits = manifest.at("build_limits");
        result.build_limits.time = get_value_def<uint64_t>(limits, result.build_limits.time, "time");
        result.build_limits.memory = get_value_def<uint64_t>(limits, result.build_limits.memory, "memory");
        result.build_limits.process_count = get_value_def<uint64_t>(limits, 16, "process_count");
    } else {
        result.build_limits.time = 10000;
        result.build_limits.process_count = 16;
    }
    return result;
}

shared_ptr<const toolchain> toolchain_repository::read(const string &toolchain_id) const {
    LOG(INFO) << "Toolchain " << toolchain_id << " cache miss, loading from " << toolchains_dir;

    if (toolchain_id.empty() || toolchain_id.find('/') != string::npos || toolchain_id == "." || toolchain_id == "..")
        throw toolchain_not_found(toolchain_id, "invalid toolchain name");

    fs::path dir = toolchains_dir / toolchain_id;
    if (!fs::is_regular_file(dir / "manifest.json"))
        throw toolchain_not_found(toolchain_id, "manifest.json is missing");
    if (!fs::is_regular_file(dir / "image.txt"))
        throw toolchain_not_found(toolchain_id, "image.txt is missing");

    auto result = make_shared<toolchain>();
    try {
        *result = parse_toolchain(json::parse(read_file_content(dir / "manifest.json")));
    } catch (json::exception &ex) {
        throw toolchain_not_found(toolchain_id, string("invalid manifest: ") + ex.what());
    } catch (invalid_argument &ex) {
        throw toolchain_not_found(toolchain_id, string("invalid manifest: ") + ex.what());
    }
    result->name = toolchain_id;
    result->image = boost::algorithm::trim_copy(read_file_content(dir / "image.txt"));
    if (result->image.empty())
        throw toolchain_not_found(toolchain_id, "image.txt is empty");

    LOG(INFO) << "Toolchain " << toolchain_id << " loaded, image " << result->image;
    return result;
}

}  // namespace arbiter
