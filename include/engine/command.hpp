#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quest::engine {

/**
 * @brief 命令在执行序列中承担的角色
 */
enum class step_role {
    SETUP,
    COMPILE,
    BUILD,
    RUN,
    TEARDOWN
};

/**
 * @brief 获取步骤名，同时也是工具链配置中的步骤键
 */
const char *get_step_name(step_role role);

/**
 * @brief 由 runner 产生的一条待执行命令
 */
struct command {
    step_role role = step_role::RUN;

    /**
     * @brief 程序 (argv[0]) 及其参数，argv[0] 会在 PATH 中查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 工作目录，即本次执行的工作目录
     */
    std::filesystem::path working_dir;

    /**
     * @brief 额外设置的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 是否在前面的步骤失败后仍然执行
     * 清理步骤总是执行，且不影响最终结果。
     */
    bool always_run = false;
};

/**
 * @brief 子进程的终止方式
 */
enum class termination {
    /**
     * @brief 子进程正常退出
     */
    EXITED,

    /**
     * @brief 子进程因为信号而崩溃
     */
    SIGNALED,

    /**
     * @brief 超出时钟时间限制被终止
     */
    TIMEOUT,

    /**
     * @brief 超出 CPU 时间、文件大小限制或者持续大量输出被终止
     */
    RESOURCE_EXCEEDED,

    /**
     * @brief 调用方取消了执行
     */
    CANCELLED,

    /**
     * @brief 无法启动子进程，或者监控子进程时出错
     */
    INTERNAL_ERROR
};

const char *get_termination_name(termination term);

/**
 * @brief 一条命令的原始执行结果
 */
struct raw_outcome {
    step_role role = step_role::RUN;

    termination term = termination::INTERNAL_ERROR;

    /**
     * @brief 正常退出时为返回值，因信号崩溃时为 128 + 信号值，其他情况为空
     */
    std::optional<int> exit_code;

    int signal = 0;

    std::string output;

    std::string error;

    bool truncated_stdout = false;

    bool truncated_stderr = false;

    long duration_millis = 0;

    /**
     * @brief 执行引擎产生的诊断信息，如无法启动程序的原因
     */
    std::string message;

    bool succeeded() const;
};

}  // namespace quest::engine
