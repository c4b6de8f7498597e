#pragma once

#include <map>
#include <string>
#include <vector>
#include "problem/problem.hpp"

namespace arbiter {

/**
 * @brief 在沙箱内执行的一条命令
 * argv 和 env 可以包含替换变量，比如 $(Run.SourceFilePath)，
 * 由执行器请求构造时展开。
 */
struct command_template {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string cwd = "/jjs";

    /**
     * @brief 展开命令中的替换变量
     * @param substitutions 变量名到值的映射，变量在命令中写作 $(name)
     */
    command_template expand(const std::map<std::string, std::string> &substitutions) const;
};

/**
 * @brief 编程语言的编译、运行配置
 * 加载后不再修改
 */
struct toolchain {
    /**
     * @brief 机器可读的名称，即工具链文件夹名
     */
    std::string name;

    std::string title;

    /**
     * @brief 选手代码在沙箱中的文件名，比如 main.cpp
     */
    std::string filename;

    /**
     * @brief 编译命令，按顺序执行，任意一条失败即为编译错误
     */
    std::vector<command_template> build;

    command_template run;

    /**
     * @brief 编译时的资源限制
     */
    resource_limits build_limits;

    std::map<std::string, std::string> env;

    /**
     * @brief 执行镜像，由 image.txt 给出
     */
    std::string image;
};

/**
 * @brief 代码文件在编译沙箱内的路径
 */
extern const char *SOURCE_FILE_PATH_VAR;

/**
 * @brief 编译产物在沙箱内的路径
 */
extern const char *BINARY_FILE_PATH_VAR;

}  // namespace arbiter
