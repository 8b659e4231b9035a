#include "engine/request.hpp"
#include <boost/assign.hpp>
#include <limits>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/stl_utils.hpp"

namespace quest::engine {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<language, const char *> language_name = boost::assign::map_list_of
    (language::PYTHON, "python")
    (language::JAVASCRIPT, "javascript")
    (language::JAVA, "java")
    (language::CSHARP, "csharp")
    (language::SELENIUM, "selenium");
// clang-format on

const char *get_language_name(language lang) {
    return language_name.at(lang);
}

language parse_language(const string &name) {
    string lower = to_lower(name);
    for (auto &[lang, value] : language_name)
        if (lower == value) return lang;
    throw unsupported_configuration("unsupported language " + name);
}

bool test_summary::operator==(const test_summary &other) const {
    return passed == other.passed && failed == other.failed;
}

/**
 * @brief 读取请求中的限制，负数、小数或者超出范围的值都是非法请求
 */
template <typename T>
static void get_limit_if_exists(const json &j, const string &key, optional<T> &value) {
    if (!exists(j, key)) return;
    const json &limit = j.at(key);
    if (!limit.is_number_unsigned() || limit.get<uint64_t>() > numeric_limits<T>::max())
        throw invalid_request(key + " must be a non-negative integer, got " + limit.dump());
    value = limit.get<T>();
}

void from_json(const json &j, execution_request &request) {
    get_if_exists(j, "id", request.id);
    request.lang = parse_language(j.at("language").get<string>());
    get_if_exists(j, "framework", request.framework);
    if (request.framework && request.framework->empty())
        request.framework = nullopt;
    j.at("sourceCode").get_to(request.source_code);
    get_if_exists(j, "auxiliaryFiles", request.auxiliary_files);
    get_limit_if_exists(j, "timeLimitMillis", request.time_limit_millis);
    get_limit_if_exists(j, "maxOutputBytes", request.max_output_bytes);
}

void to_json(json &j, const execution_request &request) {
    j = {{"language", get_language_name(request.lang)},
         {"sourceCode", request.source_code}};
    if (!request.id.empty()) j["id"] = request.id;
    if (request.framework) j["framework"] = *request.framework;
    if (!request.auxiliary_files.empty()) j["auxiliaryFiles"] = request.auxiliary_files;
    if (request.time_limit_millis) j["timeLimitMillis"] = *request.time_limit_millis;
    if (request.max_output_bytes) j["maxOutputBytes"] = *request.max_output_bytes;
}

void to_json(json &j, const test_summary &summary) {
    j = {{"passed", summary.passed}, {"failed", summary.failed}};
}

void from_json(const json &j, test_summary &summary) {
    j.at("passed").get_to(summary.passed);
    j.at("failed").get_to(summary.failed);
}

void to_json(json &j, const execution_result &result) {
    j = {{"status", get_status_name(result.stat)},
         {"stdout", result.output},
         {"stderr", result.error},
         {"truncatedStdout", result.truncated_stdout},
         {"truncatedStderr", result.truncated_stderr},
         {"durationMillis", result.duration_millis}};
    if (!result.id.empty()) j["id"] = result.id;
    if (result.exit_code) j["exitCode"] = *result.exit_code;
    if (result.environment) j["environment"] = *result.environment;
    if (result.tests) j["tests"] = *result.tests;
}

void from_json(const json &j, execution_result &result) {
    get_if_exists(j, "id", result.id);
    result.stat = parse_status(j.at("status").get<string>());
    j.at("stdout").get_to(result.output);
    j.at("stderr").get_to(result.error);
    get_if_exists(j, "truncatedStdout", result.truncated_stdout);
    get_if_exists(j, "truncatedStderr", result.truncated_stderr);
    get_if_exists(j, "durationMillis", result.duration_millis);
    get_if_exists(j, "exitCode", result.exit_code);
    get_if_exists(j, "environment", result.environment);
    get_if_exists(j, "tests", result.tests);
}

}  // namespace quest::engine
