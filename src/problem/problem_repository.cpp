#include "problem/problem_repository.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <map>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static const char *MANIFEST_FILE = "manifest.json";
static const char *DEFAULT_GROUP = "default";

problem_repository::problem_repository(const fs::path &problems_dir)
    : problems_dir(problems_dir),
      cache([this](const string &problem_id) { return read(problem_id); }) {}

shared_ptr<const problem> problem_repository::load(const string &problem_id) {
    return cache.get(problem_id);
}

void problem_repository::invalidate(const string &problem_id) {
    LOG(INFO) << "Invalidating cached problem " << problem_id;
    cache.invalidate(problem_id);
}

const fs::path &problem_repository::directory() const {
    return problems_dir;
}

shared_ptr<const problem> problem_repository::read(const string &problem_id) const {
    LOG(INFO) << "Problem " << problem_id << " cache miss, loading from " << problems_dir;

    if (problem_id.empty() || problem_id.find('/') != string::npos || problem_id == "." || problem_id == "..")
        throw problem_not_found(problem_id);

    fs::path root = problems_dir / problem_id;
    if (!fs::is_directory(root))
        throw problem_not_found(problem_id);

    fs::path manifest_path = root / MANIFEST_FILE;
    if (!fs::is_regular_file(manifest_path))
        throw problem_corrupt(problem_id, "manifest.json is missing");

    json manifest;
    try {
        manifest = json::parse(read_file_content(manifest_path));
    } catch (json::exception &ex) {
        throw problem_corrupt(problem_id, string("manifest.json is not valid JSON: ") + ex.what());
    }

    auto result = make_shared<problem>(parse_problem(problem_id, fs::weakly_canonical(root), manifest));
    LOG(INFO) << "Problem " << problem_id << " loaded with " << result->tests.size() << " tests, "
              << result->valuer.groups.size() << " groups, scoring mode " << get_scoring_mode_name(result->valuer.mode);
    return result;
}

/**
 * @brief 解析题目包内的文件引用
 * 以 / 开头的路径相对于文件系统根目录，否则相对于题目包文件夹
 */
static fs::path resolve_file(const string &problem_id, const fs::path &root, const string &ref) {
    if (ref.empty())
        throw problem_corrupt(problem_id, "empty file reference");
    try {
        assert_safe_path(ref);
    } catch (invalid_argument &) {
        throw problem_corrupt(problem_id, "file reference " + ref + " escapes the package");
    }
    fs::path path = ref.front() == '/' ? fs::path(ref) : root / ref;
    if (!fs::exists(path))
        throw problem_corrupt(problem_id, "referenced file " + path.string() + " does not exist");
    return path;
}

static resource_limits parse_limits(const json &j, const resource_limits &defaults) {
    resource_limits limits = defaults;
    if (j.is_null()) return limits;
    limits.time = get_value_def<uint64_t>(j, defaults.time, "time");
    limits.memory = get_value_def<uint64_t>(j, defaults.memory, "memory");
    limits.process_count = get_value_def<uint64_t>(j, defaults.process_count, "process_count");
    return limits;
}

static scoring_mode parse_scoring_mode(const string &problem_id, const string &mode) {
    if (mode == "simple_sum") return scoring_mode::SIMPLE_SUM;
    if (mode == "stop_on_first_failure") return scoring_mode::STOP_ON_FIRST_FAILURE;
    if (mode == "grouped") return scoring_mode::GROUPED;
    throw problem_corrupt(problem_id, "unknown scoring mode " + mode);
}

/**
 * @brief 检查测试组依赖关系是否有环（Kahn 拓扑排序）
 */
static bool is_acyclic(const vector<group_spec> &groups) {
    vector<size_t> indegree(groups.size(), 0);
    vector<vector<size_t>> dependents(groups.size());
    for (size_t i = 0; i < groups.size(); ++i)
        for (size_t dep : groups[i].depends_on) {
            ++indegree[i];
            dependents[dep].push_back(i);
        }

    vector<size_t> ready;
    for (size_t i = 0; i < groups.size(); ++i)
        if (indegree[i] == 0) ready.push_back(i);

    size_t visited = 0;
    while (!ready.empty()) {
        size_t current = ready.back();
        ready.pop_back();
        ++visited;
        for (size_t next : dependents[current])
            if (--indegree[next] == 0) ready.push_back(next);
    }
    return visited == groups.size();
}

static vector<group_spec> parse_groups(const string &problem_id, const json &valuer, const vector<test_spec> &tests) {
    vector<group_spec> groups;
    map<string, size_t> group_index;

    if (!exists(valuer, "groups")) {
        // 没有配置测试组时，每个不同的测试组名称形成一个独立的测试组，每个测试点 1 分
        for (size_t i = 0; i < tests.size(); ++i) {
            auto it = group_index.find(tests[i].group);
            if (it == group_index.end()) {
                group_spec group;
                group.name = tests[i].group;
                group.scoring = group_scoring::EACH;
                group_index[group.name] = groups.size();
                groups.push_back(group);
                it = group_index.find(tests[i].group);
            }
            auto &group = groups[it->second];
            group.tests.push_back(i);
            ++group.score;
        }
        return groups;
    }

    const json &groups_json = valuer.at("groups");
    if (!groups_json.is_array())
        throw problem_corrupt(problem_id, "valuer.groups must be an array");

    for (auto &group_json : groups_json) {
        group_spec group;
        try {
            group.name = get_value<string>(group_json, "name");
            group.score = get_value_def<uint32_t>(group_json, 0, "score");
            string scoring = get_value_def<string>(group_json, "complete", "scoring");
            if (scoring == "complete")
                group.scoring = group_scoring::COMPLETE;
            else if (scoring == "each")
                group.scoring = group_scoring::EACH;
            else
                throw problem_corrupt(problem_id, "unknown group scoring " + scoring);
        } catch (invalid_argument &ex) {
            throw problem_corrupt(problem_id, ex.what());
        }
        if (group_index.count(group.name))
            throw problem_corrupt(problem_id, "duplicate group " + group.name);
        group_index[group.name] = groups.size();
        groups.push_back(group);
    }

    // 所有测试组都登记以后才能解析依赖，允许依赖声明在后面的测试组
    for (size_t i = 0; i < groups.size(); ++i) {
        const json &group_json = groups_json[i];
        vector<string> depends_on;
        try {
            depends_on = get_value_def<vector<string>>(group_json, {}, "depends_on");
        } catch (invalid_argument &ex) {
            throw problem_corrupt(problem_id, ex.what());
        }
        set<size_t> unique_deps;
        for (auto &name : depends_on) {
            auto it = group_index.find(name);
            if (it == group_index.end())
                throw problem_corrupt(problem_id, "group " + groups[i].name + " depends on unknown group " + name);
            if (it->second == i)
                throw problem_corrupt(problem_id, "group " + name + " depends on itself");
            unique_deps.insert(it->second);
        }
        groups[i].depends_on.assign(unique_deps.begin(), unique_deps.end());
        groups[i].dependent = get_value_def<bool>(group_json, !depends_on.empty(), "dependent");
    }

    for (size_t i = 0; i < tests.size(); ++i) {
        auto it = group_index.find(tests[i].group);
        if (it == group_index.end())
            throw problem_corrupt(problem_id, "test " + to_string(i) + " belongs to unknown group " + tests[i].group);
        groups[it->second].tests.push_back(i);
    }

    if (!is_acyclic(groups))
        throw problem_corrupt(problem_id, "group dependencies contain a cycle");

    return groups;
}

problem parse_problem(const string &problem_id, const fs::path &root, const json &manifest) {
    problem result;
    result.id = problem_id;
    result.root = root;

    if (!manifest.is_object())
        throw problem_corrupt(problem_id, "manifest must be an object");

    result.title = get_value_def<string>(manifest, problem_id, "title");

    resource_limits default_limits = parse_limits(manifest.value("limits", json()), resource_limits());

    if (!exists(manifest, "tests") || !manifest.at("tests").is_array())
        throw problem_corrupt(problem_id, "tests is missing");
    for (auto &test_json : manifest.at("tests")) {
        test_spec test;
        size_t index = result.tests.size();
        if (!exists(test_json, "input"))
            throw problem_corrupt(problem_id, "test " + to_string(index) + " has no input");
        try {
            test.input = resolve_file(problem_id, root, get_value<string>(test_json, "input"));
            if (exists(test_json, "answer"))
                test.answer = resolve_file(problem_id, root, get_value<string>(test_json, "answer"));
            test.group = get_value_def<string>(test_json, DEFAULT_GROUP, "group");
            test.limits = parse_limits(test_json.value("limits", json()), default_limits);
        } catch (invalid_argument &ex) {
            throw problem_corrupt(problem_id, ex.what());
        }
        result.tests.push_back(move(test));
    }

    if (!exists(manifest, "checker", "exe"))
        throw problem_corrupt(problem_id, "checker is missing");
    try {
        result.checker.exe = resolve_file(problem_id, root, get_value<string>(manifest, "checker", "exe"));
        result.checker.args = get_value_def<vector<string>>(manifest, {}, "checker", "args");
    } catch (invalid_argument &ex) {
        throw problem_corrupt(problem_id, ex.what());
    }

    if (!exists(manifest, "valuer", "mode"))
        throw problem_corrupt(problem_id, "valuer.mode is missing");
    const json &valuer = manifest.at("valuer");
    try {
        result.valuer.mode = parse_scoring_mode(problem_id, get_value<string>(valuer, "mode"));
    } catch (invalid_argument &ex) {
        throw problem_corrupt(problem_id, ex.what());
    }
    result.valuer.groups = parse_groups(problem_id, valuer, result.tests);

    return result;
}

}  // namespace arbiter
