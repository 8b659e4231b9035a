#include "engine/normalizer.hpp"
#include "common/io_utils.hpp"

namespace quest::engine {
using namespace std;

/**
 * @brief 拼接输出，超过上限时截断并返回 true
 */
static bool append_clamped(string &target, const string &text, size_t limit) {
    if (text.empty()) return false;
    if (target.size() >= limit) return true;
    target += text;
    if (target.size() > limit) {
        utf8_truncate(target, limit);
        return true;
    }
    return false;
}

static bool is_preparation(step_role role) {
    return role == step_role::SETUP || role == step_role::COMPILE || role == step_role::BUILD;
}

execution_result internal_error_result(const string &message, size_t max_output_bytes) {
    execution_result result;
    result.stat = status::INTERNAL_ERROR;
    result.error = message;
    result.truncated_stderr = result.error.size() > max_output_bytes;
    utf8_truncate(result.error, max_output_bytes);
    return result;
}

execution_result normalize(const runner &r, const execution_plan &plan, const vector<raw_outcome> &outcomes, size_t max_output_bytes, const engine_config &config) {
    execution_result result;
    result.environment = plan.environment;

    const raw_outcome *last = nullptr, *forced = nullptr;
    for (auto &outcome : outcomes) {
        result.duration_millis += outcome.duration_millis;
        if (outcome.role == step_role::TEARDOWN) continue;

        last = &outcome;
        if (is_preparation(outcome.role)) {
            // 构建工具在 stdout 输出进度与耗时，只有失败时才作为诊断信息放入 stderr
            if (!outcome.succeeded()) {
                result.truncated_stderr |= outcome.truncated_stdout;
                result.truncated_stderr |= append_clamped(result.error, outcome.output, max_output_bytes);
            }
        } else {
            result.truncated_stdout |= outcome.truncated_stdout;
            result.truncated_stdout |= append_clamped(result.output, outcome.output, max_output_bytes);
        }
        result.truncated_stderr |= outcome.truncated_stderr;
        result.truncated_stderr |= append_clamped(result.error, outcome.error, max_output_bytes);
        if (!outcome.message.empty() && outcome.term == termination::INTERNAL_ERROR)
            result.truncated_stderr |= append_clamped(result.error, outcome.message + "\n", max_output_bytes);

        if (!forced && outcome.term != termination::EXITED && outcome.term != termination::SIGNALED)
            forced = &outcome;
    }

    if (!last) {
        result.stat = status::INTERNAL_ERROR;
        result.truncated_stderr |= append_clamped(result.error, "no command was executed\n", max_output_bytes);
        return result;
    }

    if (forced) {
        switch (forced->term) {
            case termination::TIMEOUT:
            case termination::CANCELLED:
                result.stat = status::TIMEOUT;
                break;
            case termination::RESOURCE_EXCEEDED:
                result.stat = status::RESOURCE_EXCEEDED;
                break;
            default:
                result.stat = status::INTERNAL_ERROR;
                break;
        }
        result.exit_code = forced->term == termination::RESOURCE_EXCEEDED ? forced->exit_code : nullopt;

        // 超时前测试框架可能已经输出了部分统计
        auto partial = interpret(r, outcomes, config);
        result.tests = partial.tests;
        return result;
    }

    auto verdict = interpret(r, outcomes, config);
    result.stat = verdict.stat;
    result.tests = verdict.tests;
    if (result.stat != status::INTERNAL_ERROR && result.stat != status::TIMEOUT)
        result.exit_code = last->exit_code;
    return result;
}

}  // namespace quest::engine
