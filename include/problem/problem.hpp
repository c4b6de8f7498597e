#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含题目包的信息
 * 包含：
 * 1. resource_limits 类（表示一次运行的资源限制）
 * 2. test_spec 类（表示一个测试点）
 * 3. group_spec、valuer_config 类（表示评分方式）
 * 4. problem 类（表示一个加载完成的题目包）
 */
namespace arbiter {

/**
 * @brief 一次沙箱运行的资源限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制，单位为毫秒
     */
    uint64_t time = 1000;

    /**
     * @brief 内存限制，单位为字节
     */
    uint64_t memory = 256 * 1024 * 1024;

    /**
     * @brief 进程数限制
     */
    uint64_t process_count = 1;
};

bool operator==(const resource_limits &a, const resource_limits &b);

/**
 * @brief 表示一个测试点
 * 测试点只能通过在 problem.tests 中的下标来引用，valuer 也使用下标
 */
struct test_spec {
    /**
     * @brief 输入数据文件，已经解析成绝对路径
     */
    std::filesystem::path input;

    /**
     * @brief 标准答案文件，可以不存在（比如比较器自行判断答案）
     */
    std::optional<std::filesystem::path> answer;

    resource_limits limits;

    /**
     * @brief 测试点所属的测试组名称
     */
    std::string group;
};

/**
 * @brief 测试组的计分方式
 */
enum class group_scoring {
    COMPLETE,  // 测试组所有测试点通过后才获得全部分数
    EACH       // 按照通过的测试点比例获得分数（向下取整）
};

/**
 * @brief 表示一个测试组
 */
struct group_spec {
    std::string name;

    /**
     * @brief 测试组总分
     */
    uint32_t score = 0;

    group_scoring scoring = group_scoring::COMPLETE;

    /**
     * @brief 依赖的测试组在 valuer_config.groups 中的下标
     * 只有依赖的测试组都评测完成后，本测试组才会开始评测
     */
    std::vector<std::size_t> depends_on;

    /**
     * @brief 依赖的测试组没有全部通过时是否跳过本测试组
     * 跳过的测试点不会被提交给执行器，记为 skipped 并且不得分
     */
    bool dependent = true;

    /**
     * @brief 属于本测试组的测试点下标，按照下标升序
     */
    std::vector<std::size_t> tests;
};

/**
 * @brief 评分模式
 */
enum class scoring_mode {
    SIMPLE_SUM,             // 一次性评测所有测试点，按照测试组计分
    STOP_ON_FIRST_FAILURE,  // 按顺序逐个评测，第一个失败的测试点之后不再评测（ICPC 模式）
    GROUPED                 // 按照测试组依赖关系评测（IOI 子任务模式）
};

const char *get_scoring_mode_name(scoring_mode);

struct valuer_config {
    scoring_mode mode = scoring_mode::SIMPLE_SUM;

    /**
     * @brief 所有的测试组，保证依赖关系无环
     */
    std::vector<group_spec> groups;
};

/**
 * @brief 比较器
 */
struct checker_spec {
    std::filesystem::path exe;
    std::vector<std::string> args;
};

/**
 * @brief 一个加载完成的题目包
 * 加载后不再修改，由多个并发评测的提交只读共享
 */
struct problem {
    std::string id;

    std::string title;

    /**
     * @brief 题目包所在的文件夹
     */
    std::filesystem::path root;

    std::vector<test_spec> tests;

    checker_spec checker;

    valuer_config valuer;

    /**
     * @brief 获得测试点所属测试组在 valuer.groups 中的下标
     */
    std::size_t group_of(std::size_t test_index) const;

    /**
     * @brief 所有测试组总分之和
     */
    uint32_t max_score() const;
};

}  // namespace arbiter
