#include "config.hpp"
#include <fmt/args.h>
#include <fmt/format.h>
#include <boost/assign.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace quest {
using namespace std;
using namespace nlohmann;

static const string JUNIT_CONSOLE = "/usr/share/java/junit-platform-console-standalone.jar";
static const string TESTNG_CLASSPATH = "/usr/share/java/testng.jar:/usr/share/java/jcommander.jar";

engine_config engine_config::defaults() {
    using boost::assign::list_of;
    using boost::assign::map_list_of;

    // clang-format off
    const map<string, toolchain> toolchains = map_list_of
        ("python", toolchain{
            {"run", {"python3", "{source}"}}})
        ("python/pytest", toolchain{
            {"run", {"python3", "-m", "pytest", "{source}", "-v", "-p", "no:cacheprovider"}}})
        ("python/unittest", toolchain{
            {"run", {"python3", "-m", "unittest", "{module}", "-v"}}})
        ("javascript", toolchain{
            {"run", {"node", "{source}"}}})
        ("javascript/mocha", toolchain{
            {"run", {"mocha", "--reporter", "spec", "{source}"}}})
        ("javascript/jest", toolchain{
            {"run", {"jest", "--ci", "--rootDir", "{workspace}", "{source}"}}})
        ("java", toolchain{
            {"compile", {"javac", "-d", "{workspace}", "{source}"}},
            {"run", {"java", "-cp", "{workspace}", "{class}"}}})
        ("java/junit", toolchain{
            {"compile", {"javac", "-d", "{workspace}", "-cp", JUNIT_CONSOLE, "{source}"}},
            {"run", {"java", "-jar", JUNIT_CONSOLE, "--disable-banner", "--class-path", "{workspace}", "--select-class", "{class}"}}})
        ("java/testng", toolchain{
            {"compile", {"javac", "-d", "{workspace}", "-cp", TESTNG_CLASSPATH, "{source}"}},
            {"run", {"java", "-cp", "{workspace}:" + TESTNG_CLASSPATH, "org.testng.TestNG", "-testclass", "{class}"}}})
        ("java/cucumber", toolchain{
            {"build", {"mvn", "-q", "-o", "-f", "{project}", "test-compile"}},
            {"run", {"mvn", "-o", "-f", "{project}", "test"}}})
        ("csharp", toolchain{
            {"build", {"dotnet", "build", "{project}", "-nologo", "-v", "q", "-o", "{workspace}/bin"}},
            {"run", {"dotnet", "{workspace}/bin/Quest.dll"}}})
        ("csharp/nunit", toolchain{
            {"build", {"dotnet", "build", "{project}", "-nologo", "-v", "q"}},
            {"run", {"dotnet", "test", "{project}", "--no-build", "-nologo"}}})
        ("csharp/xunit", toolchain{
            {"build", {"dotnet", "build", "{project}", "-nologo", "-v", "q"}},
            {"run", {"dotnet", "test", "{project}", "--no-build", "-nologo"}}})
        ("csharp/mstest", toolchain{
            {"build", {"dotnet", "build", "{project}", "-nologo", "-v", "q"}},
            {"run", {"dotnet", "test", "{project}", "--no-build", "-nologo"}}})
        ("selenium", toolchain{
            {"setup", {"test", "-r", "{workspace}/webdriver-session.json"}},
            {"teardown", {"rm", "-f", "{workspace}/webdriver-session.json"}}});

    const map<string, vector<string>> compile_error_patterns = map_list_of
        ("python", list_of<string>("\\bSyntaxError\\b")("\\bIndentationError\\b")("\\bTabError\\b").convert_to_container<vector<string>>())
        ("javascript", list_of<string>("\\bSyntaxError\\b").convert_to_container<vector<string>>());

    const map<string, string> environment = map_list_of
        ("PYTHONDONTWRITEBYTECODE", "1")
        ("PYTHONUNBUFFERED", "1")
        ("DOTNET_CLI_TELEMETRY_OPTOUT", "1")
        ("DOTNET_NOLOGO", "1");
    // clang-format on

    engine_config config;
    config.toolchains = toolchains;
    config.compile_error_patterns = compile_error_patterns;
    config.environment = environment;
    return config;
}

const vector<string> &engine_config::step(const string &runner_key, const string &step) const {
    auto chain = toolchains.find(runner_key);
    if (chain == toolchains.end())
        throw internal_error("no toolchain configured for " + runner_key);
    auto argv = chain->second.find(step);
    if (argv == chain->second.end() || argv->second.empty())
        throw internal_error("toolchain " + runner_key + " has no " + step + " step");
    return argv->second;
}

bool engine_config::has_step(const string &runner_key, const string &step) const {
    auto chain = toolchains.find(runner_key);
    return chain != toolchains.end() && chain->second.count(step) && !chain->second.at(step).empty();
}

void from_json(const json &j, resource_limits &limits) {
    get_if_exists(j, "cpuSeconds", limits.cpu_seconds);
    get_if_exists(j, "memoryBytes", limits.memory_bytes);
    get_if_exists(j, "processes", limits.processes);
    get_if_exists(j, "fileBytes", limits.file_bytes);
    get_if_exists(j, "noCoreDumps", limits.no_core_dumps);
}

void from_json(const json &j, engine_config &config) {
    get_if_exists(j, "defaultTimeLimitMillis", config.default_time_limit_millis);
    get_if_exists(j, "buildTimeLimitMillis", config.build_time_limit_millis);
    get_if_exists(j, "defaultMaxOutputBytes", config.default_max_output_bytes);
    get_if_exists(j, "maxConcurrentExecutions", config.max_concurrent_executions);
    get_if_exists(j, "maxQueuedExecutions", config.max_queued_executions);
    if (exists(j, "workspaceRoot"))
        config.workspace_root = j.at("workspaceRoot").get<string>();
    get_if_exists(j, "sweepIntervalSeconds", config.sweep_interval_seconds);
    get_if_exists(j, "orphanAgeSeconds", config.orphan_age_seconds);
    get_if_exists(j, "killGraceMillis", config.kill_grace_millis);
    get_if_exists(j, "runawayBytesPerWindow", config.runaway_bytes_per_window);
    get_if_exists(j, "runawayWindowMillis", config.runaway_window_millis);
    get_if_exists(j, "runawayWindows", config.runaway_windows);
    if (exists(j, "limits"))
        from_json(j.at("limits"), config.limits);

    if (exists(j, "toolchains")) {
        for (auto &[key, steps] : j.at("toolchains").items()) {
            auto &chain = config.toolchains[key];
            for (auto &[step, argv] : steps.items())
                argv.get_to(chain[step]);
        }
    }

    if (exists(j, "compileErrorPatterns")) {
        for (auto &[lang, patterns] : j.at("compileErrorPatterns").items())
            patterns.get_to(config.compile_error_patterns[lang]);
    }

    if (exists(j, "environment")) {
        for (auto &[key, value] : j.at("environment").items())
            value.get_to(config.environment[key]);
    }
    get_if_exists(j, "dotnetTargetFramework", config.dotnet_target_framework);
}

engine_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("configuration file " + path.string() + " does not exist");
    engine_config config = engine_config::defaults();
    json j = json::parse(read_file_content(path));
    from_json(j, config);
    return config;
}

vector<string> expand_command(const vector<string> &argv, const map<string, string> &variables) {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (auto &[name, value] : variables)
        store.push_back(fmt::arg(name.c_str(), value));

    vector<string> result;
    for (auto &arg : argv) {
        try {
            result.push_back(fmt::vformat(arg, store));
        } catch (fmt::format_error &ex) {
            throw internal_error(fmt::format("malformed command template \"{}\": {}", arg, ex.what()));
        }
    }
    return result;
}

}  // namespace quest
