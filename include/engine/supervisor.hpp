#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include "config.hpp"
#include "engine/command.hpp"

/**
 * 子进程监控
 * 每条命令都在独立的进程组中运行，监控器负责：
 * 1. 设置 rlimit 限制（CPU 时间、地址空间、进程数、文件大小、core dump）；
 * 2. 通过管道同时读取子进程的 stdout 和 stderr，超出上限的数据被丢弃，但子进程继续运行；
 * 3. 时钟时间超限、调用方取消或者输出失控时，先向整个进程组发送 SIGTERM，
 *    等待 kill_grace 后再发送 SIGKILL；
 * 4. 主进程退出后杀死进程组内残留的进程，确保没有后代进程活得比命令更久。
 */
namespace quest::engine {

/**
 * @brief 取消标记，可以在其他线程中调用 cancel 取消正在执行的命令
 */
struct cancellation_token {
    void cancel() noexcept;
    bool is_cancelled() const noexcept;

private:
    std::atomic<bool> cancelled{false};
};

/**
 * @brief 单条命令的监控参数
 */
struct supervision_limits {
    std::chrono::milliseconds wall_time{10000};

    /**
     * @brief stdout 和 stderr 各自保留的最大字节数
     */
    std::size_t max_output_bytes = 65536;

    resource_limits rlimits;

    std::chrono::milliseconds kill_grace{500};

    std::size_t runaway_bytes_per_window = 1 << 20;

    std::chrono::milliseconds runaway_window{1000};

    /**
     * @brief 连续多少个窗口丢弃的字节数超过 runaway_bytes_per_window 时终止程序，0 表示不检测
     */
    unsigned runaway_windows = 5;
};

/**
 * @brief 根据配置生成监控参数
 * @param wall_time 本条命令的时钟时间限制
 * @param max_output_bytes 输出上限
 */
supervision_limits make_supervision_limits(const engine_config &config, std::chrono::milliseconds wall_time, std::size_t max_output_bytes);

/**
 * @brief 执行一条命令并等待其结束
 * 这个函数不会抛出异常：程序不存在、无法启动或者监控过程中的系统调用错误
 * 都会以 termination::INTERNAL_ERROR 的形式返回。
 * @param cmd 要执行的命令
 * @param limits 监控参数
 * @param cancel 取消标记，可以为空
 * @return 命令的原始执行结果，对每次调用恰好有一个终止方式
 */
raw_outcome supervise(const command &cmd, const supervision_limits &limits, const cancellation_token *cancel = nullptr);

}  // namespace quest::engine
