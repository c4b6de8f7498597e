#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "executor/executor_client.hpp"

/**
 * 执行器的 HTTP 协议
 * 一个 invoke request 由若干个按阶段执行的步骤组成：
 * 1. 准备文件（空文件、stdout/stderr 文件、卷）
 * 2. 创建沙箱（指定镜像、资源限制、挂载的文件夹）
 * 3. 在沙箱中执行命令
 * 执行器按顺序执行所有步骤后，返回每个步骤的结果以及请求的输出文件。
 */
namespace arbiter::executor {

/**
 * @brief 准备好的执行器请求
 */
struct invoke_request {
    /**
     * @brief POST /exec 的请求体
     */
    nlohmann::json body;

    /**
     * @brief 执行命令的步骤在 body.steps 中的下标
     * 编译请求中按编译命令顺序排列；运行请求中依次为选手程序、比较器
     */
    std::vector<std::size_t> command_steps;
};

/**
 * @brief 单个命令的执行结果分类
 */
enum class command_status {
    STARTUP,             // 命令无法启动
    TIME_LIMIT,          // CPU 时间超出限制
    MEMORY_LIMIT,        // 内存超出限制
    SECURITY_VIOLATION,  // 被 SIGSYS 杀死（调用了被禁止的系统调用）
    RUNTIME,             // 返回值非零
    OK
};

/**
 * @brief 根据资源限制对命令执行结果分类
 * @param limits 命令执行时的资源限制，time 为毫秒
 * @param result 执行器返回的 ExecuteCommand 结果，cpu_time 为纳秒，memory 为字节
 * @throw infrastructure_error 数值字段的类型不正确
 */
command_status describe_command_result(const resource_limits &limits, const nlohmann::json &result);

/**
 * @brief 构造编译请求：在编译沙箱中依次执行工具链的编译命令，并导出编译产物
 */
invoke_request build_compile_request(const std::string &id, const toolchain &tc, const std::string &source);

/**
 * @brief 构造运行请求：在运行沙箱中执行选手程序，再在比较器沙箱中执行比较器
 * @throw std::system_error 测试数据或者比较器无法读取
 */
invoke_request build_run_request(const std::string &id, const toolchain &tc, const compiled_artifact &artifact, const test_input &input, const resource_limits &limits);

/**
 * @brief 解析编译请求的响应
 * @throw infrastructure_error 响应格式不正确
 */
run_outcome interpret_compile_response(const invoke_request &request, const toolchain &tc, const nlohmann::json &response);

/**
 * @brief 解析运行请求的响应
 * 选手程序的错误作为正常结果返回；比较器崩溃或者输出无法解析时返回 JUDGE_FAULT
 * @throw infrastructure_error 响应格式不正确或者选手程序无法在沙箱中启动
 */
run_outcome interpret_run_response(const invoke_request &request, const resource_limits &limits, const nlohmann::json &response);

/**
 * @brief 解析比较器的决定文件
 * 文件的每一行是 "key: value"，其中 outcome 取值为 Ok、WrongAnswer、PresentationError、BadChecker
 * @throw std::invalid_argument 无法解析
 */
status parse_checker_decision(const std::string &decision);

}  // namespace arbiter::executor
