#pragma once

#include <cstddef>
#include <vector>
#include "config.hpp"
#include "engine/command.hpp"
#include "engine/request.hpp"
#include "engine/runner.hpp"

namespace quest::engine {

/**
 * @brief 将原始执行结果转换为统一的执行结果
 * 
 * 结果的优先级：
 * 1. 监控器报告的超时（包括取消）、资源超限、内部错误优先于 runner 的解释；
 * 2. 否则使用 runner 的解释（编译错误、运行错误、成功）。
 * 总是执行的清理步骤不影响结果，其输出也不计入结果。
 * 
 * @param r 处理请求的 runner
 * @param plan runner 生成的执行计划
 * @param outcomes 已执行命令的原始结果
 * @param max_output_bytes stdout 和 stderr 各自的上限
 */
execution_result normalize(const runner &r, const execution_plan &plan, const std::vector<raw_outcome> &outcomes, std::size_t max_output_bytes, const engine_config &config);

/**
 * @brief 生成状态为 INTERNAL_ERROR 的执行结果，message 放在 stderr 中
 */
execution_result internal_error_result(const std::string &message, std::size_t max_output_bytes);

}  // namespace quest::engine
