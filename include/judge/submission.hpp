#pragma once

#include <string>

namespace arbiter {

/**
 * @brief 一个选手提交
 * 在评测请求时创建，评测过程中不会被修改
 */
struct submission {
    /**
     * @brief 提交的 id，用于日志、比较器日志文件夹、评测结果
     * 为空时由评测服务生成
     */
    std::string id;

    /**
     * @brief 题目 id，即题目包的文件夹名
     */
    std::string problem_id;

    /**
     * @brief 工具链 id，即工具链的文件夹名
     */
    std::string toolchain_id;

    /**
     * @brief 选手代码
     */
    std::string source;
};

}  // namespace arbiter
