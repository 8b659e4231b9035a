#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quest {

/**
 * @brief quest-runner 命令行程序的返回值
 */
enum exit_codes {
    E_SUCCESS = 0,
    E_FAILURE = 1,
    E_INTERNAL_ERROR = 2,
    E_UNSUPPORTED_CONFIGURATION = 3,
    E_INVALID_REQUEST = 4
};

/**
 * @brief 子进程的 rlimit 限制，未设置的项表示不限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制（秒）
     * 软限制到达时内核发送 SIGXCPU，硬限制比软限制多 1 秒。
     */
    std::optional<unsigned> cpu_seconds;

    /**
     * @brief 地址空间限制（字节）
     * JVM 和 .NET 运行时会预留大量虚拟内存，对这两类工具链设置过小会导致无法启动。
     */
    std::optional<std::size_t> memory_bytes;

    /**
     * @brief 进程数限制
     * RLIMIT_NPROC 按用户统计，而不是按进程组统计。
     */
    std::optional<unsigned> processes;

    /**
     * @brief 单个文件的大小限制（字节），超出时内核发送 SIGXFSZ
     */
    std::optional<std::size_t> file_bytes;

    bool no_core_dumps = true;
};

/**
 * @brief 工具链的命令模板
 * 键为步骤名（setup、compile、build、run、teardown），值为 argv 模板。
 * 模板中可以使用 {source}、{module}、{class}、{workspace}、{project} 占位符，
 * 使用 fmt 的命名参数语法展开，字面的大括号需要写成 {{ 和 }}。
 */
typedef std::map<std::string, std::vector<std::string>> toolchain;

/**
 * @brief 执行引擎的全部配置
 * 在启动时构造一次，之后只读，显式传递给需要的组件。
 */
struct engine_config {
    /**
     * @brief 请求未指定时间限制时使用的运行时间限制
     */
    unsigned default_time_limit_millis = 10000;

    /**
     * @brief 编译、构建、准备和清理步骤的时间限制
     * 请求的时间限制只作用于运行步骤。
     */
    unsigned build_time_limit_millis = 60000;

    /**
     * @brief 请求未指定输出上限时，stdout 和 stderr 各自的字节上限
     */
    std::size_t default_max_output_bytes = 65536;

    unsigned max_concurrent_executions = 4;

    std::size_t max_queued_executions = 64;

    /**
     * @brief 工作目录的根目录
     * 
     * workspace_root
     * ├── quest-<uuid> // 一次执行独占的工作目录，执行完成后删除
     * │   ├── main.py // 用户代码（示例）
     * │   └── ... // 附加文件与生成的项目文件
     * └── ...
     */
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "quest";

    unsigned sweep_interval_seconds = 300;

    /**
     * @brief 超过这个时间没有修改且不属于任何执行的工作目录将被清理
     */
    unsigned orphan_age_seconds = 3600;

    /**
     * @brief 发送 SIGTERM 之后等待多久再发送 SIGKILL
     */
    unsigned kill_grace_millis = 500;

    /**
     * @brief 输出已被截断后，每个采样窗口内允许丢弃的字节数
     * 连续 runaway_windows 个窗口超过这个值时认为程序失控，直接终止。
     */
    std::size_t runaway_bytes_per_window = 1 << 20;

    unsigned runaway_window_millis = 1000;

    unsigned runaway_windows = 5;

    resource_limits limits;

    /**
     * @brief runner 键（如 "python"、"java/junit"、"selenium"）到工具链的映射
     */
    std::map<std::string, toolchain> toolchains;

    /**
     * @brief 语言名到编译错误特征的映射（正则表达式）
     * 解释型语言运行失败且 stderr 匹配特征、stdout 为空时，认为是编译错误。
     */
    std::map<std::string, std::vector<std::string>> compile_error_patterns;

    /**
     * @brief 所有命令额外设置的环境变量
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 生成 C# 项目文件时使用的 TargetFramework
     */
    std::string dotnet_target_framework = "net8.0";

    /**
     * @brief 构造带有内置工具链的默认配置
     */
    static engine_config defaults();

    /**
     * @brief 获取 runner_key 对应工具链的某一步骤的命令模板
     * @throw internal_error 若该步骤没有配置
     */
    const std::vector<std::string> &step(const std::string &runner_key, const std::string &step) const;

    bool has_step(const std::string &runner_key, const std::string &step) const;
};

void from_json(const nlohmann::json &j, resource_limits &limits);

/**
 * @brief 从 json 中读取配置，缺失的键保持 config 中原有的值
 * toolchains 中的工具链按步骤覆盖，未提到的步骤保留原值。
 */
void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 在默认配置的基础上读取配置文件
 * @throw std::invalid_argument 配置文件不存在
 * @throw nlohmann::json::exception 配置文件格式不正确
 */
engine_config load_config(const std::filesystem::path &path);

/**
 * @brief 展开命令模板中的占位符
 * @param argv 命令模板
 * @param variables 占位符名到值的映射
 * @throw internal_error 模板中使用了未定义的占位符或者格式不正确
 */
std::vector<std::string> expand_command(const std::vector<std::string> &argv, const std::map<std::string, std::string> &variables);

}  // namespace quest
