#include "engine/framework.hpp"
#include <boost/assign.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <regex>
#include <unordered_map>
#include "common/stl_utils.hpp"

namespace quest::engine {
using namespace std;

// clang-format off
static const unordered_map<test_framework, const char *> framework_name = boost::assign::map_list_of
    (test_framework::PYTEST, "pytest")
    (test_framework::UNITTEST, "unittest")
    (test_framework::MOCHA, "mocha")
    (test_framework::JEST, "jest")
    (test_framework::JUNIT, "junit")
    (test_framework::TESTNG, "testng")
    (test_framework::CUCUMBER, "cucumber")
    (test_framework::NUNIT, "nunit")
    (test_framework::XUNIT, "xunit")
    (test_framework::MSTEST, "mstest");

static const unordered_map<test_framework, language> framework_language = boost::assign::map_list_of
    (test_framework::PYTEST, language::PYTHON)
    (test_framework::UNITTEST, language::PYTHON)
    (test_framework::MOCHA, language::JAVASCRIPT)
    (test_framework::JEST, language::JAVASCRIPT)
    (test_framework::JUNIT, language::JAVA)
    (test_framework::TESTNG, language::JAVA)
    (test_framework::CUCUMBER, language::JAVA)
    (test_framework::NUNIT, language::CSHARP)
    (test_framework::XUNIT, language::CSHARP)
    (test_framework::MSTEST, language::CSHARP);
// clang-format on

const char *get_framework_name(test_framework framework) {
    return framework_name.at(framework);
}

optional<test_framework> parse_framework(const string &name) {
    string lower = to_lower(name);
    for (auto &[framework, value] : framework_name)
        if (lower == value) return framework;
    return nullopt;
}

language native_language(test_framework framework) {
    return framework_language.at(framework);
}

// 测试框架的统计信息都在单独一行中，过长的行只需要保留末尾。
// std::regex 匹配时的递归深度与输入长度成正比，不能直接匹配用户程序的整段输出。
static const size_t MAX_LINE_LENGTH = 512;

template <typename Fn>
static void for_each_line(const string &output, Fn &&fn) {
    size_t begin = 0;
    while (begin < output.size()) {
        size_t end = output.find('\n', begin);
        if (end == string::npos) end = output.size();
        size_t from = end - begin > MAX_LINE_LENGTH ? end - MAX_LINE_LENGTH : begin;
        fn(output.substr(from, end - from));
        begin = end + 1;
    }
}

/**
 * @brief 解析用例数，超出范围的数字视为没有统计信息
 */
static optional<unsigned> parse_count(const string &digits) {
    unsigned value;
    if (!boost::conversion::try_lexical_convert(digits, value)) return nullopt;
    return value;
}

/**
 * @brief 查找 pattern 在 text 中最后一次匹配的第 group 个分组
 */
static optional<unsigned> last_match(const string &text, const regex &pattern, size_t group = 1) {
    optional<unsigned> result;
    for_each_line(text, [&](const string &line) {
        for (sregex_iterator it(line.begin(), line.end(), pattern), end; it != end; ++it)
            if ((*it)[group].matched)
                if (auto count = parse_count((*it)[group].str())) result = count;
    });
    return result;
}

static optional<test_summary> make_summary(optional<unsigned> passed, optional<unsigned> failed) {
    if (!passed && !failed) return nullopt;
    test_summary summary;
    summary.passed = passed.value_or(0);
    summary.failed = failed.value_or(0);
    return summary;
}

// ========================= 1 failed, 2 passed in 0.03s =========================
static optional<test_summary> parse_pytest(const string &output) {
    static const regex summary_line("^=+ (.*\\d+ (passed|failed|error|errors).*) =+\\s*$");
    string line;
    for_each_line(output, [&](const string &candidate) {
        smatch match;
        if (regex_search(candidate, match, summary_line)) line = match[1].str();
    });
    if (line.empty()) return nullopt;

    static const regex passed("(\\d+) passed"), failed("(\\d+) failed"), errors("(\\d+) errors?");
    auto summary = make_summary(last_match(line, passed), last_match(line, failed));
    if (!summary) summary = test_summary();
    summary->failed += last_match(line, errors).value_or(0);
    return summary;
}

// Ran 3 tests in 0.001s
//
// FAILED (failures=1, errors=1)
static optional<test_summary> parse_unittest(const string &output) {
    static const regex ran("Ran (\\d+) tests?"), failures("failures=(\\d+)"), errors("errors=(\\d+)");
    auto total = last_match(output, ran);
    if (!total) return nullopt;
    unsigned failed = last_match(output, failures).value_or(0) + last_match(output, errors).value_or(0);
    test_summary summary;
    summary.failed = failed;
    summary.passed = *total > failed ? *total - failed : 0;
    return summary;
}

//   2 passing (5ms)
//   1 failing
static optional<test_summary> parse_mocha(const string &output) {
    static const regex passing("(\\d+) passing"), failing("(\\d+) failing");
    return make_summary(last_match(output, passing), last_match(output, failing));
}

// Tests:       1 failed, 2 passed, 3 total
static optional<test_summary> parse_jest(const string &output) {
    static const regex tests_line("Tests:\\s+(.*)");
    static const regex passed("(\\d+) passed"), failed("(\\d+) failed");
    optional<string> line;
    for_each_line(output, [&](const string &candidate) {
        smatch match;
        if (!line && regex_search(candidate, match, tests_line)) line = match[1].str();
    });
    if (!line) return nullopt;
    return make_summary(last_match(*line, passed), last_match(*line, failed));
}

// [         2 tests successful      ]
// [         1 tests failed          ]
static optional<test_summary> parse_junit(const string &output) {
    static const regex successful("\\[\\s*(\\d+) tests successful\\s*\\]"), failed("\\[\\s*(\\d+) tests failed\\s*\\]");
    return make_summary(last_match(output, successful), last_match(output, failed));
}

// Total tests run: 3, Passes: 2, Failures: 1, Skips: 0
static optional<test_summary> parse_testng(const string &output) {
    static const regex total("Total tests run: (\\d+)"), failures("Failures: (\\d+)"), skips("Skips: (\\d+)");
    auto run = last_match(output, total);
    if (!run) return nullopt;
    test_summary summary;
    summary.failed = last_match(output, failures).value_or(0);
    unsigned skipped = last_match(output, skips).value_or(0);
    summary.passed = *run > summary.failed + skipped ? *run - summary.failed - skipped : 0;
    return summary;
}

// Maven surefire: Tests run: 3, Failures: 1, Errors: 0, Skipped: 0
static optional<test_summary> parse_surefire(const string &output) {
    static const regex totals("Tests run: (\\d+), Failures: (\\d+), Errors: (\\d+)(, Skipped: (\\d+))?");
    optional<test_summary> result;
    for_each_line(output, [&](const string &line) {
        for (sregex_iterator it(line.begin(), line.end(), totals), end; it != end; ++it) {
            auto &match = *it;
            auto run = parse_count(match[1].str()), failures = parse_count(match[2].str()), errors = parse_count(match[3].str());
            auto skipped = match[5].matched ? parse_count(match[5].str()) : optional<unsigned>(0);
            if (!run || !failures || !errors || !skipped) continue;

            test_summary summary;
            summary.failed = *failures + *errors;
            summary.passed = *run > summary.failed + *skipped ? *run - summary.failed - *skipped : 0;
            result = summary;
        }
    });
    return result;
}

// dotnet test: Failed!  - Failed:     1, Passed:     2, Skipped:     0, Total:     3
static optional<test_summary> parse_dotnet(const string &output) {
    static const regex passed("Passed:\\s*(\\d+)"), failed("Failed:\\s*(\\d+)");
    return make_summary(last_match(output, passed), last_match(output, failed));
}

optional<test_summary> parse_test_summary(test_framework framework, const string &output) {
    switch (framework) {
        case test_framework::PYTEST: return parse_pytest(output);
        case test_framework::UNITTEST: return parse_unittest(output);
        case test_framework::MOCHA: return parse_mocha(output);
        case test_framework::JEST: return parse_jest(output);
        case test_framework::JUNIT: return parse_junit(output);
        case test_framework::TESTNG: return parse_testng(output);
        case test_framework::CUCUMBER: return parse_surefire(output);
        case test_framework::NUNIT:
        case test_framework::XUNIT:
        case test_framework::MSTEST: return parse_dotnet(output);
    }
    return nullopt;
}

}  // namespace quest::engine
