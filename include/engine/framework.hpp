#pragma once

#include <optional>
#include <string>
#include "engine/request.hpp"

namespace quest::engine {

/**
 * @brief 支持的测试框架
 */
enum class test_framework {
    PYTEST,
    UNITTEST,
    MOCHA,
    JEST,
    JUNIT,
    TESTNG,
    CUCUMBER,
    NUNIT,
    XUNIT,
    MSTEST
};

const char *get_framework_name(test_framework framework);

/**
 * @brief 根据名字解析测试框架，大小写不敏感
 * @return 不认识的框架名返回空
 */
std::optional<test_framework> parse_framework(const std::string &name);

/**
 * @brief 测试框架原生的编程语言
 * 浏览器自动化测试根据测试框架选择实际执行的语言。
 */
language native_language(test_framework framework);

/**
 * @brief 从测试框架的输出中解析测试用例统计
 * @param framework 测试框架
 * @param output 测试框架的 stdout 与 stderr
 * @return 输出中没有测试框架的统计信息时返回空
 */
std::optional<test_summary> parse_test_summary(test_framework framework, const std::string &output);

}  // namespace quest::engine
