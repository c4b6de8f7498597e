#pragma once

#include <string>

namespace arbiter {

/**
 * @brief 表示测试点或整个提交的评测结果
 * 这是一个封闭集合，COMPILE_ERROR 和 JUDGE_FAULT 只会作为提交的最终结果出现，
 * 其他结果是测试点的结果，会交给 valuer 统计。
 */
enum class status {
    /**
     * @brief 选手程序通过本测试点，或者全部需要评测的测试点都通过
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误，比较器判定选手输出与标准答案不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序运行时间超出限制
     * 由沙箱统计 CPU 时间得到，和整个提交的评测超时（JUDGE_FAULT）不同
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 选手程序运行内存超出限制
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 选手程序返回了非零返回值或者被信号杀死
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 选手程序编译错误
     * 编译失败后不再评测任何测试点
     */
    COMPILE_ERROR = 5,

    /**
     * @brief 格式错误，一般是空白字符和标准输出不符
     */
    PRESENTATION_ERROR = 6,

    /**
     * @brief 选手程序调用了被沙箱禁止的系统调用
     */
    SECURITY_VIOLATION = 7,

    /**
     * @brief 评测系统出错，不是选手的问题
     * 比如执行器无法连接、比较器崩溃、评测超出整个提交的时间预算。
     * 选手不会因此被扣分，但这个测试点也不会得分。
     */
    JUDGE_FAULT = 8
};

const char *get_display_message(status);

/**
 * @brief 用于 JSON 以及日志的机器可读名称，比如 "WrongAnswer"
 */
const char *get_status_code(status);

/**
 * @brief 将机器可读名称转换回评测结果
 * @throw std::invalid_argument 名称不存在
 */
status parse_status_code(const std::string &code);

/**
 * @brief 是否为选手造成的错误
 * JUDGE_FAULT 和 ACCEPTED 都不是选手错误
 */
bool is_contestant_failure(status);

/**
 * @brief 评测结果的严重程度，用于在多个失败的测试点中选出最终结果
 * 数值越大越严重，ACCEPTED 为 0，JUDGE_FAULT 低于所有选手错误
 */
int severity(status);

}  // namespace arbiter
