#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "engine/runner.hpp"

namespace quest::engine {

/**
 * @brief (language, framework) 到 runner 的固定映射
 * 在构造时注册所有支持的组合，之后只读，可以被多个线程同时查询。
 */
struct runner_registry {
    runner_registry();

    /**
     * @brief 查找处理该组合的 runner
     * @param lang 请求的语言
     * @param framework 请求的测试框架名，大小写不敏感，为空表示直接运行
     * @throw unsupported_configuration 没有注册对应的 runner
     */
    const runner &find(language lang, const std::optional<std::string> &framework) const;

    /**
     * @brief 列出所有支持的组合，如 "python"、"python/pytest"、"selenium/junit"
     */
    std::vector<std::string> list() const;

private:
    typedef std::pair<language, std::optional<test_framework>> runner_id;

    void add(language lang, std::optional<test_framework> framework, runner r);

    std::map<runner_id, std::shared_ptr<const runner>> runners;
};

}  // namespace quest::engine
