#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "engine/dispatcher.hpp"
#include "gtest/gtest.h"
#include "test/fake_toolchain.hpp"

using namespace std;
using namespace quest;
using namespace quest::engine;
using namespace quest::test;
namespace fs = std::filesystem;

class DispatcherTest : public ::testing::Test {
protected:
    temp_directory dir;
    engine_config config = fake_config(dir.path());
    workspace_manager workspaces{config.workspace_root};
    dispatcher d{config, workspaces};

    void TearDown() override {
        // 每次执行结束后工作目录都必须被删除
        EXPECT_EQ(count_workspaces(config.workspace_root), 0u);
        EXPECT_EQ(workspaces.active_count(), 0u);
    }
};

TEST_F(DispatcherTest, GreetingTest) {
    auto result = d.execute(shell_request("echo 'Hello, World!'"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.id, "test");
    EXPECT_FALSE(result.truncated_stdout);
}

TEST_F(DispatcherTest, EmptyOutputTest) {
    auto result = d.execute(shell_request("true"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "");
}

TEST_F(DispatcherTest, AuxiliaryFilesTest) {
    auto request = shell_request("cat data/input.txt");
    request.auxiliary_files["data/input.txt"] = "1 2 3";
    auto result = d.execute(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "1 2 3");
}

TEST_F(DispatcherTest, SyntaxErrorTest) {
    auto result = d.execute(shell_request("echo '  File \"main.py\", line 1' >&2; echo 'SyntaxError: invalid syntax' >&2; exit 1"));
    EXPECT_EQ(result.stat, status::COMPILE_ERROR);
    EXPECT_NE(result.error.find("SyntaxError"), string::npos);
}

TEST_F(DispatcherTest, RuntimeErrorTest) {
    auto result = d.execute(shell_request("echo before; echo 'ZeroDivisionError: division by zero' >&2; exit 1"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.output, "before\n");
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(DispatcherTest, CompileFailureSkipsRunTest) {
    fs::path marker = dir.path() / "ran";
    auto request = shell_request("# public class Main COMPILE_FAIL\ntouch " + marker.string() + "\n", language::JAVA);
    auto result = d.execute(request);
    EXPECT_EQ(result.stat, status::COMPILE_ERROR);
    EXPECT_NE(result.error.find("Main.java:1: error"), string::npos);
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(DispatcherTest, CompiledProgramTest) {
    auto result = d.execute(shell_request("# public class Greeter\necho compiled", language::JAVA));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "compiled\n");
}

TEST_F(DispatcherTest, JavaRuntimeErrorTest) {
    auto result = d.execute(shell_request("# public class Main\n"
                                          "echo 'Exception in thread \"main\" java.lang.ArithmeticException: / by zero' >&2\n"
                                          "echo '\tat Main.main(Main.java:3)' >&2\n"
                                          "exit 1\n",
                                          language::JAVA));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.error.find("java.lang.ArithmeticException"), string::npos);
}

TEST_F(DispatcherTest, ProjectBuildTest) {
    auto request = shell_request("echo dotnet", language::CSHARP);
    auto first = d.execute(request);
    EXPECT_EQ(first.stat, status::SUCCESS);
    // 构建日志每次都不同，不能出现在结果中
    EXPECT_EQ(first.output, "dotnet\n");
    EXPECT_EQ(first.error, "");

    auto second = d.execute(request);
    EXPECT_EQ(second.output, first.output);
}

TEST_F(DispatcherTest, ProjectBuildFailureTest) {
    fs::path marker = dir.path() / "ran";
    auto result = d.execute(shell_request("# COMPILE_FAIL\ntouch " + marker.string() + "\n", language::CSHARP));
    EXPECT_EQ(result.stat, status::COMPILE_ERROR);
    EXPECT_EQ(result.output, "");
    EXPECT_NE(result.error.find("error CS0103"), string::npos);
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(DispatcherTest, TimeoutTest) {
    auto request = shell_request("echo started; while :; do :; done");
    request.time_limit_millis = 2000;
    auto result = d.execute(request);
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_FALSE(result.exit_code);
    EXPECT_EQ(result.output, "started\n");
    EXPECT_GE(result.duration_millis, 2000);
    EXPECT_LT(result.duration_millis, 2000 + 2000);
}

TEST_F(DispatcherTest, DefaultTimeLimitTest) {
    config.default_time_limit_millis = 500;
    auto result = d.execute(shell_request("sleep 5"));
    EXPECT_EQ(result.stat, status::TIMEOUT);
}

TEST_F(DispatcherTest, FrameworkFailureTest) {
    auto request = shell_request("echo 'test_main.py::test_a PASSED'\n"
                                 "echo 'test_main.py::test_b PASSED'\n"
                                 "echo 'test_main.py::test_c FAILED'\n"
                                 "echo '========================= 1 failed, 2 passed in 0.03s ========================='\n"
                                 "exit 1\n",
                                 language::PYTHON, string("pytest"));
    auto result = d.execute(request);
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    ASSERT_TRUE(result.tests);
    EXPECT_EQ(result.tests->passed, 2u);
    EXPECT_EQ(result.tests->failed, 1u);
}

TEST_F(DispatcherTest, UnsupportedConfigurationTest) {
    EXPECT_THROW(d.execute(shell_request("x", language::CSHARP, string("junit"))), unsupported_configuration);
    EXPECT_THROW(d.execute(shell_request("x", language::PYTHON, string("rspec"))), unsupported_configuration);
    EXPECT_EQ(count_workspaces(config.workspace_root), 0u);
}

TEST_F(DispatcherTest, InvalidRequestTest) {
    EXPECT_THROW(d.execute(shell_request("  \n")), invalid_request);

    auto escape = shell_request("true");
    escape.auxiliary_files["../escape.txt"] = "x";
    EXPECT_THROW(d.execute(escape), invalid_request);
    EXPECT_FALSE(fs::exists(config.workspace_root.parent_path() / "escape.txt"));

    auto zero = shell_request("true");
    zero.time_limit_millis = 0;
    EXPECT_THROW(d.execute(zero), invalid_request);
    EXPECT_EQ(count_workspaces(config.workspace_root), 0u);
}

TEST_F(DispatcherTest, DeterminismTest) {
    auto request = shell_request("echo out; echo err >&2; exit 4");
    auto first = d.execute(request);
    auto second = d.execute(request);
    EXPECT_EQ(first.stat, second.stat);
    EXPECT_EQ(first.output, second.output);
    EXPECT_EQ(first.error, second.error);
    EXPECT_EQ(first.exit_code, second.exit_code);
}

TEST_F(DispatcherTest, OversizeOutputTest) {
    auto request = shell_request("head -c 200000 /dev/zero | tr '\\0' a");
    request.max_output_bytes = 1000;
    auto result = d.execute(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output.size(), 1000u);
    EXPECT_TRUE(result.truncated_stdout);
}

TEST_F(DispatcherTest, MissingToolchainTest) {
    config.toolchains["python"]["run"] = {"quest-no-such-interpreter", "{source}"};
    auto result = d.execute(shell_request("echo hello"));
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_NE(result.error.find("quest-no-such-interpreter"), string::npos);
}

TEST_F(DispatcherTest, MalformedTemplateTest) {
    config.toolchains["python"]["run"] = {"/bin/sh", "{script}"};
    auto result = d.execute(shell_request("echo hello"));
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_NE(result.error.find("{script}"), string::npos);
}

TEST_F(DispatcherTest, HarnessTest) {
    auto result = d.execute(shell_request("test -r webdriver-session.json && echo session", language::SELENIUM));
    EXPECT_EQ(result.stat, status::SUCCESS);
    // 清理步骤的输出不计入结果
    EXPECT_EQ(result.output, "session\n");
}

TEST_F(DispatcherTest, HarnessSetupFailureTest) {
    fs::path marker = dir.path() / "torn-down";
    config.toolchains["selenium"]["setup"] = {"/bin/sh", "-c", "echo 'no browser' >&2; exit 1"};
    config.toolchains["selenium"]["teardown"] = {"/bin/sh", "-c", "touch " + marker.string()};
    auto result = d.execute(shell_request("echo should not run", language::SELENIUM));
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_FALSE(result.exit_code);
    EXPECT_EQ(result.output, "");
    EXPECT_NE(result.error.find("no browser"), string::npos);
    EXPECT_TRUE(fs::exists(marker));
}

TEST_F(DispatcherTest, CancelTest) {
    cancellation_token cancel;
    cancel.cancel();
    auto result = d.execute(shell_request("echo hello"), &cancel);
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_EQ(result.output, "");
}
