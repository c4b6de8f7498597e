#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "common/single_flight.hpp"
#include "toolchain/toolchain.hpp"

namespace arbiter {

/**
 * @brief 工具链仓库
 * 和 problem_repository 相同，进程启动时创建一次，按工具链名称缓存，
 * 每个工具链的 manifest 只读取一次。
 *
 * TOOLCHAINS_DIR
 * ├── cpp // toolchain name
 * │   ├── manifest.json // 编译运行命令，参见 parse_toolchain
 * │   └── image.txt // 执行镜像
 * └── ...
 */
struct toolchain_repository {
    explicit toolchain_repository(const std::filesystem::path &toolchains_dir);

    /**
     * @brief 获取工具链
     * @throw toolchain_not_found 工具链不存在或者 manifest 不合法
     */
    std::shared_ptr<const toolchain> resolve(const std::string &toolchain_id);

private:
    std::filesystem::path toolchains_dir;
    single_flight_cache<std::string, toolchain> cache;

    std::shared_ptr<const toolchain> read(const std::string &toolchain_id) const;
};

/**
 * @throw std::invalid_argument manifest 不合法
 */
toolchain parse_toolchain(const nlohmann::json &manifest);

}  // namespace arbiter
