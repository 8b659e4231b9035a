#include "common/io_utils.hpp"
#include "engine/normalizer.hpp"
#include "engine/registry.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace quest;
using namespace quest::engine;

class NormalizerTest : public ::testing::Test {
protected:
    engine_config config = engine_config::defaults();
    runner_registry registry;
    execution_plan plan;

    static raw_outcome exited(step_role role, int exit_code, const string &output = "", const string &error = "", long duration = 10) {
        raw_outcome o;
        o.role = role;
        o.term = termination::EXITED;
        o.exit_code = exit_code;
        o.output = output;
        o.error = error;
        o.duration_millis = duration;
        return o;
    }

    static raw_outcome forced(step_role role, termination term, const string &output = "", long duration = 10) {
        raw_outcome o;
        o.role = role;
        o.term = term;
        o.output = output;
        o.duration_millis = duration;
        return o;
    }

    execution_result normalize_java(const vector<raw_outcome> &outcomes, size_t max_output = 65536) {
        return normalize(registry.find(language::JAVA, nullopt), plan, outcomes, max_output, config);
    }
};

TEST_F(NormalizerTest, SuccessTest) {
    auto result = normalize_java({exited(step_role::COMPILE, 0, "", "Note: deprecated API\n", 800),
                                  exited(step_role::RUN, 0, "Hello, World!\n", "", 50)});
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_EQ(result.error, "Note: deprecated API\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.duration_millis, 850);
    EXPECT_FALSE(result.truncated_stdout);
    EXPECT_FALSE(result.tests);
}

TEST_F(NormalizerTest, CompileErrorTest) {
    auto result = normalize_java({exited(step_role::COMPILE, 1, "", "Main.java:1: error: ';' expected\n")});
    EXPECT_EQ(result.stat, status::COMPILE_ERROR);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.error.find("';' expected"), string::npos);
}

TEST_F(NormalizerTest, TimeoutTest) {
    auto result = normalize_java({exited(step_role::COMPILE, 0),
                                  forced(step_role::RUN, termination::TIMEOUT, "partial\n", 2000)});
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_FALSE(result.exit_code);
    EXPECT_EQ(result.output, "partial\n");
    EXPECT_EQ(result.duration_millis, 2010);
}

TEST_F(NormalizerTest, CancelledTest) {
    auto result = normalize_java({forced(step_role::COMPILE, termination::CANCELLED)});
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_FALSE(result.exit_code);
}

TEST_F(NormalizerTest, ResourceExceededTest) {
    auto outcome = forced(step_role::RUN, termination::RESOURCE_EXCEEDED);
    outcome.exit_code = 152;
    auto result = normalize_java({exited(step_role::COMPILE, 0), outcome});
    EXPECT_EQ(result.stat, status::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exit_code, 152);
}

TEST_F(NormalizerTest, InternalErrorTest) {
    auto outcome = forced(step_role::COMPILE, termination::INTERNAL_ERROR);
    outcome.message = "toolchain javac is not installed or not executable";
    auto result = normalize_java({outcome});
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_FALSE(result.exit_code);
    EXPECT_NE(result.error.find("javac is not installed"), string::npos);
}

TEST_F(NormalizerTest, NothingExecutedTest) {
    auto result = normalize_java({});
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(NormalizerTest, TeardownIgnoredTest) {
    auto &selenium = registry.find(language::SELENIUM, nullopt);
    auto result = normalize(selenium, plan,
                            {exited(step_role::SETUP, 0, "", "", 5),
                             exited(step_role::RUN, 0, "page title\n", "", 100),
                             exited(step_role::TEARDOWN, 1, "teardown\n", "rm: failed\n", 5)},
                            65536, config);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "page title\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.duration_millis, 110);
}

TEST_F(NormalizerTest, TruncateCombinedOutputTest) {
    auto result = normalize_java({exited(step_role::COMPILE, 0, "", string(600, 'a')),
                                  exited(step_role::RUN, 1, "", string(600, 'b'))},
                                 1000);
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.error.size(), 1000u);
    EXPECT_EQ(result.error, string(600, 'a') + string(400, 'b'));
    EXPECT_TRUE(result.truncated_stderr);
    EXPECT_FALSE(result.truncated_stdout);
}

TEST_F(NormalizerTest, BuildOutputHiddenTest) {
    auto &csharp = registry.find(language::CSHARP, nullopt);
    auto result = normalize(csharp, plan,
                            {exited(step_role::BUILD, 0, "\n\n    0 Warning(s)\n    0 Error(s)\n\nTime Elapsed 00:00:02.52\n", "", 2500),
                             exited(step_role::RUN, 0, "Hello\n", "", 80)},
                            65536, config);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.output, "Hello\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.duration_millis, 2580);
}

TEST_F(NormalizerTest, BuildDiagnosticsOnStdoutTest) {
    auto &csharp = registry.find(language::CSHARP, nullopt);
    auto result = normalize(csharp, plan,
                            {exited(step_role::BUILD, 1, "Program.cs(5,17): error CS0029: Cannot implicitly convert type 'string' to 'int'\n")},
                            65536, config);
    EXPECT_EQ(result.stat, status::COMPILE_ERROR);
    EXPECT_EQ(result.output, "");
    EXPECT_NE(result.error.find("error CS0029"), string::npos);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(NormalizerTest, HarnessSetupFailureTest) {
    auto &selenium = registry.find(language::SELENIUM, nullopt);
    auto result = normalize(selenium, plan,
                            {exited(step_role::SETUP, 1, "", "no browser\n", 5),
                             exited(step_role::TEARDOWN, 0, "", "", 5)},
                            65536, config);
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_FALSE(result.exit_code);
    EXPECT_EQ(result.error, "no browser\n");
}

TEST_F(NormalizerTest, TruncatedBySupervisorTest) {
    auto outcome = exited(step_role::RUN, 0, string(100, 'a'));
    outcome.truncated_stdout = true;
    auto result = normalize_java({exited(step_role::COMPILE, 0), outcome}, 100);
    EXPECT_TRUE(result.truncated_stdout);
    EXPECT_EQ(result.output.size(), 100u);
}

TEST_F(NormalizerTest, TruncateUtf8Test) {
    string text;
    for (int i = 0; i < 10; ++i) text += "\xe4\xbd\xa0";  // 你
    auto result = normalize_java({exited(step_role::COMPILE, 0), exited(step_role::RUN, 0, text)}, 10);
    EXPECT_TRUE(result.truncated_stdout);
    EXPECT_LE(result.output.size(), 10u);
    EXPECT_EQ(result.output.size() % 3, 0u);
    EXPECT_TRUE(utf8_check_is_valid(result.output));
}

TEST_F(NormalizerTest, EnvironmentTest) {
    plan.environment = "browser_js";
    auto result = normalize(registry.find(language::JAVASCRIPT, nullopt), plan, {exited(step_role::RUN, 0, "ALERT: hi\n")}, 65536, config);
    EXPECT_EQ(result.environment, "browser_js");
    EXPECT_EQ(result.stat, status::SUCCESS);
}

TEST_F(NormalizerTest, PartialTestsOnTimeoutTest) {
    auto &mocha = registry.find(language::JAVASCRIPT, string("mocha"));
    auto result = normalize(mocha, plan, {forced(step_role::RUN, termination::TIMEOUT, "  3 passing (2s)\n")}, 65536, config);
    EXPECT_EQ(result.stat, status::TIMEOUT);
    ASSERT_TRUE(result.tests);
    EXPECT_EQ(result.tests->passed, 3u);
}

TEST_F(NormalizerTest, InternalErrorResultTest) {
    auto result = internal_error_result("unable to create workspace", 8);
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_EQ(result.error, "unable t");
    EXPECT_TRUE(result.truncated_stderr);
    EXPECT_FALSE(result.exit_code);
}
