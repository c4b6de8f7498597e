#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码，可以是二进制)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 覆盖写入文件，必要时创建父文件夹
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 题目包内的文件引用如果包含 "../"，那么最后可能读取到题目包外的文件，
 * 检查失败时抛出 std::invalid_argument
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 断言 name 只是一个文件名，不包含路径分隔符，也不是 "." 或者 ".."
 * 用于把外部传入的 id 作为文件名，检查失败时抛出 std::invalid_argument
 */
std::string assert_safe_file_name(const std::string &name);

}  // namespace arbiter
