#include "engine/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <functional>
#include <regex>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "engine/browser.hpp"

namespace quest::engine {
using namespace std;
namespace fs = std::filesystem;

static const char *PROJECT_NAME = "Quest";
static const char *SESSION_FILE = "webdriver-session.json";

static const char *POM_TEMPLATE = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<project xmlns="http://maven.apache.org/POM/4.0.0"
         xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
         xsi:schemaLocation="http://maven.apache.org/POM/4.0.0 http://maven.apache.org/xsd/maven-4.0.0.xsd">
    <modelVersion>4.0.0</modelVersion>
    <groupId>quest</groupId>
    <artifactId>cucumber-test</artifactId>
    <version>1.0</version>
    <properties>
        <maven.compiler.source>11</maven.compiler.source>
        <maven.compiler.target>11</maven.compiler.target>
        <project.build.sourceEncoding>UTF-8</project.build.sourceEncoding>
    </properties>
    <dependencies>
        <dependency>
            <groupId>io.cucumber</groupId>
            <artifactId>cucumber-java</artifactId>
            <version>7.15.0</version>
            <scope>test</scope>
        </dependency>
        <dependency>
            <groupId>io.cucumber</groupId>
            <artifactId>cucumber-junit</artifactId>
            <version>7.15.0</version>
            <scope>test</scope>
        </dependency>
        <dependency>
            <groupId>junit</groupId>
            <artifactId>junit</artifactId>
            <version>4.13.2</version>
            <scope>test</scope>
        </dependency>
    </dependencies>
</project>
)XML";

static const char *CUCUMBER_RUNNER = R"JAVA(import io.cucumber.junit.Cucumber;
import io.cucumber.junit.CucumberOptions;
import org.junit.runner.RunWith;

@RunWith(Cucumber.class)
@CucumberOptions(features = "src/test/resources", plugin = {"pretty"})
public class QuestCucumberRunnerTest {
}
)JAVA";

static const char *CSPROJ_TEMPLATE = R"XML(<Project Sdk="Microsoft.NET.Sdk">
  <PropertyGroup>
    <OutputType>{output_type}</OutputType>
    <TargetFramework>{target_framework}</TargetFramework>
    <AssemblyName>{assembly}</AssemblyName>
    <ImplicitUsings>enable</ImplicitUsings>
    <Nullable>disable</Nullable>
    <IsPackable>false</IsPackable>
  </PropertyGroup>
  <ItemGroup>
{packages}  </ItemGroup>
</Project>
)XML";

/**
 * @brief C# 测试框架需要引用的 NuGet 包
 * 执行引擎不负责下载依赖，这些包需要预先存在于本机的 NuGet 缓存中。
 */
static string dotnet_packages(optional<test_framework> framework) {
    vector<pair<string, string>> packages;
    if (framework) packages.emplace_back("Microsoft.NET.Test.Sdk", "17.8.0");
    if (framework == test_framework::NUNIT) {
        packages.emplace_back("NUnit", "3.14.0");
        packages.emplace_back("NUnit3TestAdapter", "4.5.0");
    } else if (framework == test_framework::XUNIT) {
        packages.emplace_back("xunit", "2.6.2");
        packages.emplace_back("xunit.runner.visualstudio", "2.5.4");
    } else if (framework == test_framework::MSTEST) {
        packages.emplace_back("MSTest.TestFramework", "3.1.1");
        packages.emplace_back("MSTest.TestAdapter", "3.1.1");
    }

    string result;
    for (auto &[name, version] : packages)
        result += fmt::format("    <PackageReference Include=\"{}\" Version=\"{}\" />\n", name, version);
    return result;
}

string extract_java_class(const string &source) {
    static const regex public_class("public\\s+(?:(?:final|abstract)\\s+)*class\\s+(\\w+)");
    smatch match;
    if (regex_search(source, match, public_class))
        return match[1].str();
    return "Main";
}

static string key_of(language lang, optional<test_framework> framework) {
    string key = get_language_name(lang);
    if (framework) key += string("/") + get_framework_name(*framework);
    return key;
}

string runner_key(const runner &r) {
    return visit(overloaded{
                     [](const interpreted_runner &v) { return key_of(v.lang, v.framework); },
                     [](const compiled_runner &v) { return key_of(language::JAVA, v.framework); },
                     [](const project_runner &v) { return key_of(v.lang, v.framework); },
                     [](const browser_runner &) { return key_of(language::JAVASCRIPT, nullopt); },
                     [](const harness_runner &) { return key_of(language::SELENIUM, nullopt); }},
                 r.impl);
}

static command make_command(step_role role, const string &key, const map<string, string> &variables, const workspace &ws, const engine_config &config) {
    command cmd;
    cmd.role = role;
    cmd.argv = expand_command(config.step(key, get_step_name(role)), variables);
    cmd.working_dir = ws.root();
    cmd.env = config.environment;
    cmd.always_run = role == step_role::TEARDOWN;
    return cmd;
}

/**
 * @brief 写入附加文件
 * @param redirect 返回附加文件应当写入的目录，返回空表示写入工作目录根目录
 */
static void write_auxiliary_files(const execution_request &request, workspace &ws, const function<string(const string &)> &redirect = nullptr) {
    for (auto &[filename, content] : request.auxiliary_files) {
        string dir = redirect ? redirect(filename) : "";
        ws.write(dir.empty() ? filename : dir + "/" + filename, content);
    }
}

static map<string, string> base_variables(const workspace &ws) {
    return {{"workspace", ws.root().string()}};
}

static execution_plan materialize_interpreted(const interpreted_runner &r, const execution_request &request, workspace &ws, const engine_config &config) {
    string filename;
    if (r.lang == language::PYTHON)
        filename = r.framework ? "test_main.py" : "main.py";
    else
        filename = r.framework ? "main.test.js" : "main.js";

    write_auxiliary_files(request, ws);
    auto variables = base_variables(ws);
    variables["source"] = ws.write(filename, request.source_code).string();
    variables["module"] = fs::path(filename).stem().string();

    execution_plan plan;
    plan.commands.push_back(make_command(step_role::RUN, key_of(r.lang, r.framework), variables, ws, config));
    return plan;
}

static execution_plan materialize_browser(const browser_runner &, const execution_request &request, workspace &ws, const engine_config &config) {
    script_environment env = detect_script_environment(request.source_code);

    optional<string> fixture;
    for (auto &[filename, content] : request.auxiliary_files) {
        if (boost::iends_with(filename, ".html")) {
            fixture = content;
            break;
        }
    }

    write_auxiliary_files(request, ws);
    string code = env == script_environment::BROWSER ? browser_shim(fixture) + request.source_code : request.source_code;
    auto variables = base_variables(ws);
    variables["source"] = ws.write("main.js", code).string();
    variables["module"] = "main";

    execution_plan plan;
    plan.environment = get_environment_name(env);
    plan.commands.push_back(make_command(step_role::RUN, key_of(language::JAVASCRIPT, nullopt), variables, ws, config));
    return plan;
}

static execution_plan materialize_compiled(const compiled_runner &r, const execution_request &request, workspace &ws, const engine_config &config) {
    string cls = extract_java_class(request.source_code);
    string key = key_of(language::JAVA, r.framework);

    write_auxiliary_files(request, ws);
    auto variables = base_variables(ws);
    variables["class"] = cls;
    variables["module"] = cls;
    variables["source"] = ws.write(cls + ".java", request.source_code).string();

    execution_plan plan;
    plan.commands.push_back(make_command(step_role::COMPILE, key, variables, ws, config));
    plan.commands.push_back(make_command(step_role::RUN, key, variables, ws, config));
    return plan;
}

static execution_plan materialize_project(const project_runner &r, const execution_request &request, workspace &ws, const engine_config &config) {
    string key = key_of(r.lang, r.framework);
    auto variables = base_variables(ws);

    if (r.lang == language::JAVA) {
        // Maven 项目：源代码在 src/test/java，feature 文件在 src/test/resources
        string cls = extract_java_class(request.source_code);
        if (cls == "Main") cls = "CucumberTest";
        write_auxiliary_files(request, ws, [](const string &filename) -> string {
            if (boost::iends_with(filename, ".feature")) return "src/test/resources";
            if (boost::iends_with(filename, ".java")) return "src/test/java";
            return "";
        });
        variables["project"] = ws.write("pom.xml", POM_TEMPLATE).string();
        variables["class"] = cls;
        variables["module"] = cls;
        variables["source"] = ws.write("src/test/java/" + cls + ".java", request.source_code).string();
        if (request.source_code.find("@RunWith") == string::npos)
            ws.write("src/test/java/QuestCucumberRunnerTest.java", CUCUMBER_RUNNER);
    } else if (r.lang == language::CSHARP) {
        string filename = r.framework ? "Tests.cs" : "Program.cs";
        write_auxiliary_files(request, ws);
        string csproj = fmt::format(fmt::runtime(CSPROJ_TEMPLATE),
                                    fmt::arg("output_type", r.framework ? "Library" : "Exe"),
                                    fmt::arg("target_framework", config.dotnet_target_framework),
                                    fmt::arg("assembly", PROJECT_NAME),
                                    fmt::arg("packages", dotnet_packages(r.framework)));
        variables["project"] = ws.write(string(PROJECT_NAME) + ".csproj", csproj).string();
        variables["class"] = PROJECT_NAME;
        variables["module"] = PROJECT_NAME;
        variables["source"] = ws.write(filename, request.source_code).string();
    } else {
        throw internal_error(fmt::format("no project layout for language {}", get_language_name(r.lang)));
    }

    execution_plan plan;
    plan.commands.push_back(make_command(step_role::BUILD, key, variables, ws, config));
    plan.commands.push_back(make_command(step_role::RUN, key, variables, ws, config));
    return plan;
}

static execution_plan materialize_harness(const harness_runner &r, const execution_request &request, workspace &ws, const engine_config &config) {
    if (!r.inner) throw internal_error("automation harness has no inner runner");

    // 只写入会话配置，真正的浏览器会话由测试代码自己创建
    nlohmann::json session = {
        {"browser", "chrome"},
        {"headless", true},
        {"framework", r.framework ? get_framework_name(*r.framework) : "none"},
        {"language", get_language_name(request.lang)},
        {"workspace", ws.root().string()}};
    ws.write(SESSION_FILE, session.dump(4));

    auto variables = base_variables(ws);
    string key = key_of(language::SELENIUM, nullopt);

    execution_plan plan = materialize(*r.inner, request, ws, config);
    plan.commands.insert(plan.commands.begin(), make_command(step_role::SETUP, key, variables, ws, config));
    plan.commands.push_back(make_command(step_role::TEARDOWN, key, variables, ws, config));
    return plan;
}

execution_plan materialize(const runner &r, const execution_request &request, workspace &ws, const engine_config &config) {
    execution_plan plan = visit(overloaded{
                                    [&](const interpreted_runner &v) { return materialize_interpreted(v, request, ws, config); },
                                    [&](const compiled_runner &v) { return materialize_compiled(v, request, ws, config); },
                                    [&](const project_runner &v) { return materialize_project(v, request, ws, config); },
                                    [&](const browser_runner &v) { return materialize_browser(v, request, ws, config); },
                                    [&](const harness_runner &v) { return materialize_harness(v, request, ws, config); }},
                                r.impl);
    VLOG(1) << "runner " << runner_key(r) << " materialized " << plan.commands.size() << " commands in " << ws.root();
    return plan;
}

/**
 * @brief 解释型语言的语法错误发生在运行时，通过 stderr 中的特征判断
 */
static bool looks_like_compile_error(const raw_outcome &outcome, const vector<string> &patterns) {
    if (!outcome.output.empty()) return false;
    for (auto &pattern : patterns)
        if (regex_search(outcome.error, regex(pattern))) return true;
    return false;
}

static interpretation classify(const vector<raw_outcome> &outcomes, optional<test_framework> framework, const vector<string> &compile_patterns) {
    interpretation result;
    if (outcomes.empty()) return result;

    const raw_outcome *failure = nullptr, *run = nullptr;
    for (auto &outcome : outcomes) {
        if (outcome.role == step_role::TEARDOWN) continue;
        if (outcome.role == step_role::RUN) run = &outcome;
        if (!outcome.succeeded()) {
            failure = &outcome;
            break;
        }
    }

    if (framework && run)
        result.tests = parse_test_summary(*framework, run->output + "\n" + run->error);

    if (!failure) {
        result.stat = result.tests && result.tests->failed > 0 ? status::RUNTIME_ERROR : status::SUCCESS;
        return result;
    }

    switch (failure->role) {
        case step_role::COMPILE:
        case step_role::BUILD:
            result.stat = status::COMPILE_ERROR;
            break;
        case step_role::SETUP:
            result.stat = status::INTERNAL_ERROR;
            break;
        default:
            result.stat = looks_like_compile_error(*failure, compile_patterns) ? status::COMPILE_ERROR : status::RUNTIME_ERROR;
            break;
    }
    return result;
}

static const vector<string> &patterns_of(const engine_config &config, language lang) {
    static const vector<string> none;
    auto it = config.compile_error_patterns.find(get_language_name(lang));
    return it == config.compile_error_patterns.end() ? none : it->second;
}

interpretation interpret(const runner &r, const vector<raw_outcome> &outcomes, const engine_config &config) {
    static const vector<string> none;
    return visit(overloaded{
                     [&](const interpreted_runner &v) {
                         // 测试框架会自行报告语法错误，此时按运行错误处理
                         return classify(outcomes, v.framework, v.framework ? none : patterns_of(config, v.lang));
                     },
                     [&](const compiled_runner &v) { return classify(outcomes, v.framework, none); },
                     [&](const project_runner &v) { return classify(outcomes, v.framework, none); },
                     [&](const browser_runner &) { return classify(outcomes, nullopt, patterns_of(config, language::JAVASCRIPT)); },
                     [&](const harness_runner &v) {
                         for (auto &outcome : outcomes)
                             if (outcome.role == step_role::SETUP && !outcome.succeeded()) {
                                 interpretation result;
                                 result.stat = status::INTERNAL_ERROR;
                                 return result;
                             }

                         vector<raw_outcome> inner_outcomes;
                         for (auto &outcome : outcomes)
                             if (outcome.role != step_role::SETUP && outcome.role != step_role::TEARDOWN)
                                 inner_outcomes.push_back(outcome);
                         if (!v.inner) return interpretation();
                         return interpret(*v.inner, inner_outcomes, config);
                     }},
                 r.impl);
}

}  // namespace quest::engine
