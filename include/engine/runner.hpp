#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "config.hpp"
#include "engine/command.hpp"
#include "engine/framework.hpp"
#include "engine/request.hpp"
#include "engine/workspace.hpp"

/**
 * 这个头文件包含各类 runner 的定义
 * runner 负责把执行请求翻译为有序的命令序列，并在命令执行完成后解释原始执行结果。
 * runner 本身不保存任何状态，可以被多个 worker 同时使用。
 * 
 * 我们有五种 runner：
 * 1. interpreted_runner：解释型语言的单文件程序（Python、使用测试框架的 JavaScript），只有运行步骤；
 * 2. compiled_runner：先编译后运行的程序（Java），编译失败时不会执行运行步骤；
 * 3. project_runner：需要先生成项目文件再构建的程序（C#、使用 Cucumber 的 Java）；
 * 4. browser_runner：JavaScript 程序，若检测到使用了浏览器 API 则先注入模拟的浏览器环境；
 * 5. harness_runner：浏览器自动化测试，在内层 runner 的命令前后加上会话的准备和清理步骤。
 */
namespace quest::engine {

/**
 * @brief runner 生成的执行计划
 */
struct execution_plan {
    std::vector<command> commands;

    /**
     * @brief JavaScript 代码的运行环境检测结果
     */
    std::optional<std::string> environment;
};

/**
 * @brief runner 对原始执行结果的解释
 */
struct interpretation {
    status stat = status::INTERNAL_ERROR;
    std::optional<test_summary> tests;
};

struct interpreted_runner {
    language lang = language::PYTHON;
    std::optional<test_framework> framework;
};

struct compiled_runner {
    std::optional<test_framework> framework;
};

struct project_runner {
    language lang = language::CSHARP;
    std::optional<test_framework> framework;
};

struct browser_runner {
};

struct runner;

struct harness_runner {
    std::shared_ptr<const runner> inner;
    std::optional<test_framework> framework;
};

struct runner {
    std::variant<interpreted_runner, compiled_runner, project_runner, browser_runner, harness_runner> impl;
};

/**
 * @brief runner 在工具链配置中的键，如 "python/pytest"、"java"、"selenium"
 */
std::string runner_key(const runner &r);

/**
 * @brief 在工作目录中写入源代码、附加文件和项目文件，并生成命令序列
 * @throw internal_error 工具链没有配置或者命令模板不正确
 * @throw std::system_error 文件无法写入
 */
execution_plan materialize(const runner &r, const execution_request &request, workspace &ws, const engine_config &config);

/**
 * @brief 根据原始执行结果判断编译错误、运行错误或者成功
 * 超时、资源超限和内部错误由 normalizer 统一处理，这里只根据返回值判断。
 * @param outcomes 按顺序执行的命令的原始结果
 */
interpretation interpret(const runner &r, const std::vector<raw_outcome> &outcomes, const engine_config &config);

/**
 * @brief 查找 Java 源代码中第一个 public class 的类名
 * @return 类名，找不到时返回 "Main"
 */
std::string extract_java_class(const std::string &source);

}  // namespace quest::engine
