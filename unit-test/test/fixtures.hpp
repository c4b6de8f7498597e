#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace arbiter::test {

/**
 * @brief 测试用的临时文件夹，析构时删除
 */
struct temp_directory {
    temp_directory();
    ~temp_directory();

    temp_directory(const temp_directory &) = delete;
    temp_directory &operator=(const temp_directory &) = delete;

    const std::filesystem::path &path() const;

private:
    std::filesystem::path dir;
};

/**
 * @brief 在 problems_dir 下写入题目包
 * manifest 中引用的测试数据、比较器文件如果不存在会自动创建
 */
void write_problem(const std::filesystem::path &problems_dir, const std::string &problem_id, const nlohmann::json &manifest);

/**
 * @brief 生成一个 manifest，包含 test_count 个测试点，测试点 i 的输入为 tests/i.in
 * @param mode 评分模式
 */
nlohmann::json make_manifest(std::size_t test_count, const std::string &mode = "simple_sum");

/**
 * @brief 在 toolchains_dir 下写入一个 C++ 工具链
 */
void write_toolchain(const std::filesystem::path &toolchains_dir, const std::string &name);

}  // namespace arbiter::test
