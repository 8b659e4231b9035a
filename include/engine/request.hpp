#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"

namespace quest::engine {

/**
 * @brief 支持的编程语言
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    CSHARP,
    /**
     * @brief 浏览器自动化测试，实际执行的语言由测试框架决定
     */
    SELENIUM
};

const char *get_language_name(language lang);

/**
 * @brief 根据名字解析语言，大小写不敏感
 * @throw unsupported_configuration 不支持的语言
 */
language parse_language(const std::string &name);

/**
 * @brief 一次执行请求
 * 请求在进入执行引擎之后不可变。
 */
struct execution_request {
    /**
     * @brief 调用方指定的请求编号，原样返回到执行结果中
     */
    std::string id;

    language lang = language::PYTHON;

    /**
     * @brief 测试框架名，为空表示直接运行程序
     */
    std::optional<std::string> framework;

    std::string source_code;

    /**
     * @brief 附加文件，键为相对于工作目录的文件名
     */
    std::map<std::string, std::string> auxiliary_files;

    std::optional<unsigned> time_limit_millis;

    std::optional<std::size_t> max_output_bytes;
};

/**
 * @brief 测试框架报告的测试用例统计
 */
struct test_summary {
    unsigned passed = 0;
    unsigned failed = 0;

    bool operator==(const test_summary &other) const;
};

/**
 * @brief 一次执行的结果
 * 每个被接收的请求都会且只会得到一个执行结果。
 */
struct execution_result {
    std::string id;

    status stat = status::INTERNAL_ERROR;

    /**
     * @brief 所有已执行步骤的标准输出，截断到 max_output_bytes
     */
    std::string output;

    /**
     * @brief 所有已执行步骤的标准错误输出（包括编译器输出），截断到 max_output_bytes
     */
    std::string error;

    bool truncated_stdout = false;

    bool truncated_stderr = false;

    /**
     * @brief 所有已执行步骤的时钟时间之和
     */
    long duration_millis = 0;

    /**
     * @brief 最后一个步骤的返回值，超时或者内部错误时为空
     */
    std::optional<int> exit_code;

    /**
     * @brief JavaScript 代码的运行环境检测结果（browser_js、node_js、vanilla_js）
     */
    std::optional<std::string> environment;

    std::optional<test_summary> tests;
};

void from_json(const nlohmann::json &j, execution_request &request);
void to_json(nlohmann::json &j, const execution_request &request);
void to_json(nlohmann::json &j, const test_summary &summary);
void from_json(const nlohmann::json &j, test_summary &summary);
void to_json(nlohmann::json &j, const execution_result &result);
void from_json(const nlohmann::json &j, execution_result &result);

}  // namespace quest::engine
