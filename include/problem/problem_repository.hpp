#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "common/single_flight.hpp"
#include "problem/problem.hpp"

namespace arbiter {

/**
 * @brief 题目包仓库
 * 在进程启动时创建一次，由所有提交共享引用。题目包按照题目 id 缓存，
 * 同一个题目 id 同时至多只有一个加载过程。
 *
 * PROBLEMS_DIR
 * ├── a-plus-b // problem id
 * │   ├── manifest.json // 题目描述，参见 parse_problem
 * │   ├── checker // 比较器
 * │   └── tests
 * │       ├── 1.in
 * │       └── 1.out
 * └── ...
 */
struct problem_repository {
    explicit problem_repository(const std::filesystem::path &problems_dir);

    /**
     * @brief 加载题目包，已经加载过的题目包直接返回缓存
     * @param problem_id 题目 id，即题目包的文件夹名
     * @throw problem_not_found 题目包文件夹不存在
     * @throw problem_corrupt manifest 缺失必要字段或者内容不合法
     */
    std::shared_ptr<const problem> load(const std::string &problem_id);

    /**
     * @brief 使题目包缓存失效，下次 load 将重新读取题目包
     * 什么时候调用由外部决定（比如文件夹监控）
     */
    void invalidate(const std::string &problem_id);

    const std::filesystem::path &directory() const;

private:
    std::filesystem::path problems_dir;
    single_flight_cache<std::string, problem> cache;

    std::shared_ptr<const problem> read(const std::string &problem_id) const;
};

/**
 * @brief 解析题目包的 manifest.json
 * @param problem_id 题目 id，用于错误信息
 * @param root 题目包文件夹，manifest 中的相对路径都相对于这个文件夹
 * @param manifest manifest.json 的内容
 * @throw problem_corrupt manifest 不合法
 */
problem parse_problem(const std::string &problem_id, const std::filesystem::path &root, const nlohmann::json &manifest);

}  // namespace arbiter
