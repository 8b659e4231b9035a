#include "engine/registry.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace quest::engine {
using namespace std;

runner_registry::runner_registry() {
    add(language::PYTHON, nullopt, runner{interpreted_runner{language::PYTHON, nullopt}});
    for (auto framework : {test_framework::PYTEST, test_framework::UNITTEST})
        add(language::PYTHON, framework, runner{interpreted_runner{language::PYTHON, framework}});

    add(language::JAVASCRIPT, nullopt, runner{browser_runner{}});
    for (auto framework : {test_framework::MOCHA, test_framework::JEST})
        add(language::JAVASCRIPT, framework, runner{interpreted_runner{language::JAVASCRIPT, framework}});

    add(language::JAVA, nullopt, runner{compiled_runner{nullopt}});
    for (auto framework : {test_framework::JUNIT, test_framework::TESTNG})
        add(language::JAVA, framework, runner{compiled_runner{framework}});
    add(language::JAVA, test_framework::CUCUMBER, runner{project_runner{language::JAVA, test_framework::CUCUMBER}});

    add(language::CSHARP, nullopt, runner{project_runner{language::CSHARP, nullopt}});
    for (auto framework : {test_framework::NUNIT, test_framework::XUNIT, test_framework::MSTEST})
        add(language::CSHARP, framework, runner{project_runner{language::CSHARP, framework}});

    // 浏览器自动化测试的实际语言由测试框架决定，没有指定测试框架时使用 Python
    add(language::SELENIUM, nullopt, runner{harness_runner{runners.at({language::PYTHON, nullopt}), nullopt}});
    for (auto framework : {test_framework::PYTEST, test_framework::UNITTEST,
                           test_framework::MOCHA, test_framework::JEST,
                           test_framework::JUNIT, test_framework::TESTNG, test_framework::CUCUMBER,
                           test_framework::NUNIT, test_framework::MSTEST}) {
        auto inner = runners.at({native_language(framework), framework});
        add(language::SELENIUM, framework, runner{harness_runner{inner, framework}});
    }
}

void runner_registry::add(language lang, optional<test_framework> framework, runner r) {
    runners[{lang, framework}] = make_shared<const runner>(move(r));
}

const runner &runner_registry::find(language lang, const optional<string> &framework) const {
    optional<test_framework> parsed;
    if (framework) {
        parsed = parse_framework(*framework);
        if (!parsed)
            throw unsupported_configuration(fmt::format("unknown test framework {}", *framework));
    }

    auto it = runners.find({lang, parsed});
    if (it == runners.end())
        throw unsupported_configuration(fmt::format("language {} does not support test framework {}",
                                                    get_language_name(lang), *framework));
    return *it->second;
}

vector<string> runner_registry::list() const {
    vector<string> result;
    for (auto &[id, r] : runners) {
        string name = get_language_name(id.first);
        if (id.second) name += string("/") + get_framework_name(*id.second);
        result.push_back(name);
    }
    return result;
}

}  // namespace quest::engine
