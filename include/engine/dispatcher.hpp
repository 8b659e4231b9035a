#pragma once

#include <chrono>
#include "config.hpp"
#include "engine/registry.hpp"
#include "engine/request.hpp"
#include "engine/supervisor.hpp"
#include "engine/workspace.hpp"

namespace quest::engine {

/**
 * @brief 执行请求的入口
 * 负责选择 runner，并按 工作目录 -> runner -> 监控器 -> normalizer 的顺序处理请求，
 * 无论哪一步失败都会删除工作目录。
 * dispatcher 不保存请求相关的状态，可以被多个 worker 线程同时调用。
 */
struct dispatcher {
    dispatcher(const engine_config &config, workspace_manager &workspaces);

    /**
     * @brief 同步执行一个请求
     * @param request 执行请求
     * @param cancel 取消标记，取消后正在执行的命令会像超时一样被终止
     * @return 执行结果，工作目录创建失败等内部错误以 INTERNAL_ERROR 状态返回
     * @throw unsupported_configuration 不支持的 (language, framework) 组合，此时不会创建工作目录
     * @throw invalid_request 请求不合法，此时不会创建工作目录
     */
    execution_result execute(const execution_request &request, const cancellation_token *cancel = nullptr) const;

    const runner_registry &registry() const;

    const engine_config &config() const;

private:
    const engine_config &cfg;
    workspace_manager &workspaces;
    runner_registry runners;

    void validate(const execution_request &request) const;

    std::chrono::milliseconds time_limit_of(const command &cmd, const execution_request &request) const;
};

}  // namespace quest::engine
