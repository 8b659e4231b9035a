#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "config.hpp"
#include "engine/request.hpp"

/**
 * 测试用的工具链
 * 单元测试不依赖本机安装的 Python、Node.js、JDK 或 .NET SDK，
 * 所有工具链都被替换为执行 /bin/sh 的命令，用户代码就是 shell 脚本。
 * 
 * 用法：
 * 1. temp_directory dir;
 * 2. engine_config config = fake_config(dir.path());
 * 3. workspace_manager workspaces(config.workspace_root);
 * 4. dispatcher d(config, workspaces); d.execute(shell_request("echo hello"));
 */
namespace quest::test {

/**
 * @brief 测试期间独占的临时文件夹，析构时删除
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
 * @brief 构造使用 /bin/sh 模拟工具链的配置
 * java 的编译步骤在源代码包含 COMPILE_FAIL 时失败，
 * selenium 的清理步骤会向 stdout 输出 teardown。
 * @param root 工作目录的根目录将被设置为 root/workspaces
 */
engine_config fake_config(const std::filesystem::path &root);

/**
 * @brief 构造源代码为 shell 脚本的执行请求
 */
engine::execution_request shell_request(const std::string &script,
                                        engine::language lang = engine::language::PYTHON,
                                        const std::optional<std::string> &framework = std::nullopt);

/**
 * @brief 统计根目录下的工作目录数量
 */
std::size_t count_workspaces(const std::filesystem::path &root);

}  // namespace quest::test
