#include "engine/dispatcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "engine/normalizer.hpp"

namespace quest::engine {
using namespace std;

dispatcher::dispatcher(const engine_config &config, workspace_manager &workspaces)
    : cfg(config), workspaces(workspaces) {}

const runner_registry &dispatcher::registry() const {
    return runners;
}

const engine_config &dispatcher::config() const {
    return cfg;
}

void dispatcher::validate(const execution_request &request) const {
    if (boost::algorithm::trim_copy(request.source_code).empty())
        throw invalid_request("source code is empty");
    for (auto &[filename, content] : request.auxiliary_files)
        assert_safe_path(filename);
    if (request.time_limit_millis && *request.time_limit_millis == 0)
        throw invalid_request("time limit must be positive");
    if (request.max_output_bytes && *request.max_output_bytes == 0)
        throw invalid_request("output limit must be positive");
}

chrono::milliseconds dispatcher::time_limit_of(const command &cmd, const execution_request &request) const {
    if (cmd.role == step_role::RUN)
        return chrono::milliseconds(request.time_limit_millis.value_or(cfg.default_time_limit_millis));
    return chrono::milliseconds(cfg.build_time_limit_millis);
}

execution_result dispatcher::execute(const execution_request &request, const cancellation_token *cancel) const {
    // 不支持的组合和不合法的请求在创建工作目录之前就被拒绝
    const runner &r = runners.find(request.lang, request.framework);
    validate(request);

    size_t max_output = request.max_output_bytes.value_or(cfg.default_max_output_bytes);
    string key = runner_key(r);
    LOG(INFO) << fmt::format("executing request {} with runner {}", request.id.empty() ? "<anonymous>" : request.id, key);

    execution_result result;
    workspace ws;
    try {
        ws = workspaces.open();
        execution_plan plan = materialize(r, request, ws, cfg);

        vector<raw_outcome> outcomes;
        bool failed = false;
        for (auto &cmd : plan.commands) {
            if (failed && !cmd.always_run) continue;
            if (!cmd.always_run && cancel && cancel->is_cancelled()) {
                // 在启动下一条命令之前发现已经取消，直接按超时处理
                raw_outcome outcome;
                outcome.role = cmd.role;
                outcome.term = termination::CANCELLED;
                outcomes.push_back(outcome);
                failed = true;
                continue;
            }

            auto limits = make_supervision_limits(cfg, time_limit_of(cmd, request), max_output);
            // 清理步骤即使请求被取消也要执行
            raw_outcome outcome = supervise(cmd, limits, cmd.always_run ? nullptr : cancel);
            VLOG(1) << fmt::format("{} step of {} finished: {} in {} ms", get_step_name(cmd.role), key,
                                   get_termination_name(outcome.term), outcome.duration_millis);
            if (!cmd.always_run && !outcome.succeeded()) failed = true;
            outcomes.push_back(move(outcome));
        }

        result = normalize(r, plan, outcomes, max_output, cfg);
    } catch (std::exception &ex) {
        LOG(ERROR) << fmt::format("internal error while executing request {}: {}", request.id, ex.what());
        result = internal_error_result(ex.what(), max_output);
    }

    ws.close();
    result.id = request.id;
    LOG(INFO) << fmt::format("request {} finished with {} in {} ms", request.id.empty() ? "<anonymous>" : request.id,
                             get_status_name(result.stat), result.duration_millis);
    return result;
}

}  // namespace quest::engine
