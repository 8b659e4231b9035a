#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "engine/request.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/fake_toolchain.hpp"

using namespace std;
using namespace quest;
using namespace quest::engine;
using namespace nlohmann;

TEST(ConfigTest, DefaultsTest) {
    engine_config config = engine_config::defaults();
    EXPECT_EQ(config.default_time_limit_millis, 10000u);
    EXPECT_EQ(config.build_time_limit_millis, 60000u);
    EXPECT_EQ(config.step("python", "run"), (vector<string>{"python3", "{source}"}));
    EXPECT_TRUE(config.has_step("java", "compile"));
    EXPECT_TRUE(config.has_step("selenium", "teardown"));
    EXPECT_FALSE(config.has_step("python", "compile"));
    EXPECT_THROW(config.step("python", "compile"), internal_error);
    EXPECT_THROW(config.step("ruby", "run"), internal_error);
}

TEST(ConfigTest, FromJsonTest) {
    engine_config config = engine_config::defaults();
    json j = R"({
        "defaultTimeLimitMillis": 5000,
        "maxConcurrentExecutions": 8,
        "workspaceRoot": "/var/lib/quest",
        "limits": {"cpuSeconds": 20, "processes": 256},
        "toolchains": {
            "java": {"run": ["java", "-Xmx256m", "-cp", "{workspace}", "{class}"]},
            "ruby": {"run": ["ruby", "{source}"]}
        },
        "environment": {"JAVA_TOOL_OPTIONS": "-Xss8m"}
    })"_json;
    j.get_to(config);

    EXPECT_EQ(config.default_time_limit_millis, 5000u);
    EXPECT_EQ(config.build_time_limit_millis, 60000u);
    EXPECT_EQ(config.max_concurrent_executions, 8u);
    EXPECT_EQ(config.workspace_root.string(), "/var/lib/quest");
    EXPECT_EQ(config.limits.cpu_seconds, 20u);
    EXPECT_EQ(config.limits.processes, 256u);
    EXPECT_FALSE(config.limits.memory_bytes);
    EXPECT_TRUE(config.limits.no_core_dumps);

    // 只覆盖配置中提到的步骤
    EXPECT_EQ(config.step("java", "run")[1], "-Xmx256m");
    EXPECT_EQ(config.step("java", "compile")[0], "javac");
    EXPECT_TRUE(config.has_step("ruby", "run"));
    EXPECT_EQ(config.environment.at("JAVA_TOOL_OPTIONS"), "-Xss8m");
    EXPECT_EQ(config.environment.at("PYTHONUNBUFFERED"), "1");
}

TEST(ConfigTest, LoadConfigTest) {
    test::temp_directory dir;
    EXPECT_THROW(load_config(dir.path() / "missing.json"), invalid_argument);

    write_file_content(dir.path() / "quest.json", R"({"killGraceMillis": 1000})");
    engine_config config = load_config(dir.path() / "quest.json");
    EXPECT_EQ(config.kill_grace_millis, 1000u);
    EXPECT_TRUE(config.has_step("csharp", "build"));

    write_file_content(dir.path() / "broken.json", "{");
    EXPECT_THROW(load_config(dir.path() / "broken.json"), json::exception);
}

TEST(ConfigTest, ExpandCommandTest) {
    map<string, string> variables = {{"source", "/ws/main.py"}, {"workspace", "/ws"}};
    EXPECT_EQ(expand_command({"python3", "{source}"}, variables), (vector<string>{"python3", "/ws/main.py"}));
    EXPECT_EQ(expand_command({"{workspace}/bin/Quest.dll"}, variables), (vector<string>{"/ws/bin/Quest.dll"}));
    EXPECT_EQ(expand_command({"-e", "{{literal}}"}, variables), (vector<string>{"-e", "{literal}"}));
    EXPECT_THROW(expand_command({"{class}"}, variables), internal_error);
    EXPECT_THROW(expand_command({"{source"}, variables), internal_error);
}

TEST(ConfigTest, RequestFromJsonTest) {
    auto request = R"({
        "id": "r1",
        "language": "Python",
        "framework": "pytest",
        "sourceCode": "def test_a(): pass",
        "auxiliaryFiles": {"data.txt": "1 2 3"},
        "timeLimitMillis": 2000
    })"_json.get<execution_request>();
    EXPECT_EQ(request.id, "r1");
    EXPECT_EQ(request.lang, language::PYTHON);
    EXPECT_EQ(request.framework, "pytest");
    EXPECT_EQ(request.auxiliary_files.at("data.txt"), "1 2 3");
    EXPECT_EQ(request.time_limit_millis, 2000u);
    EXPECT_FALSE(request.max_output_bytes);

    auto plain = R"({"language": "java", "framework": "", "sourceCode": "x"})"_json.get<execution_request>();
    EXPECT_FALSE(plain.framework);

    EXPECT_THROW(R"({"language": "cobol", "sourceCode": "x"})"_json.get<execution_request>(), unsupported_configuration);
    EXPECT_THROW(R"({"sourceCode": "x"})"_json.get<execution_request>(), json::exception);
    EXPECT_THROW(R"({"language": "java"})"_json.get<execution_request>(), json::exception);

    EXPECT_THROW(R"({"language": "python", "sourceCode": "x", "timeLimitMillis": -1})"_json.get<execution_request>(), invalid_request);
    EXPECT_THROW(R"({"language": "python", "sourceCode": "x", "timeLimitMillis": 1.5})"_json.get<execution_request>(), invalid_request);
    EXPECT_THROW(R"({"language": "python", "sourceCode": "x", "timeLimitMillis": 99999999999})"_json.get<execution_request>(), invalid_request);
    EXPECT_THROW(R"({"language": "python", "sourceCode": "x", "maxOutputBytes": -4096})"_json.get<execution_request>(), invalid_request);
}

TEST(ConfigTest, ResultToJsonTest) {
    execution_result result;
    result.id = "r1";
    result.stat = status::RUNTIME_ERROR;
    result.output = "1 passed\n";
    result.error = "AssertionError\n";
    result.duration_millis = 120;
    result.exit_code = 1;
    result.tests = test_summary{1, 1};

    EXPECT_JSON_EQ(json(result), R"({
        "id": "r1",
        "status": "runtime_error",
        "stdout": "1 passed\n",
        "stderr": "AssertionError\n",
        "truncatedStdout": false,
        "truncatedStderr": false,
        "durationMillis": 120,
        "exitCode": 1,
        "tests": {"passed": 1, "failed": 1}
    })"_json);

    execution_result timeout;
    timeout.stat = status::TIMEOUT;
    json j = timeout;
    EXPECT_FALSE(j.contains("exitCode"));
    EXPECT_FALSE(j.contains("id"));
    EXPECT_EQ(j.at("status"), "timeout");
}

TEST(ConfigTest, StatusNameTest) {
    EXPECT_STREQ(get_status_name(status::SUCCESS), "success");
    EXPECT_STREQ(get_status_name(status::COMPILE_ERROR), "compile_error");
    EXPECT_STREQ(get_status_name(status::RESOURCE_EXCEEDED), "resource_exceeded");
    EXPECT_EQ(parse_status("internal_error"), status::INTERNAL_ERROR);
    EXPECT_THROW(parse_status("accepted"), invalid_argument);
}
