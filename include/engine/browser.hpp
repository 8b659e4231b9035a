#pragma once

#include <optional>
#include <string>

namespace quest::engine {

/**
 * @brief JavaScript 代码的运行环境
 */
enum class script_environment {
    /**
     * @brief 使用了 document、window、alert 等浏览器 API
     */
    BROWSER,

    /**
     * @brief 使用了 require、process、__dirname 等 Node.js API
     */
    NODE,

    /**
     * @brief 没有使用任何环境相关的 API
     */
    VANILLA
};

/**
 * @brief 获取运行环境名：browser_js、node_js 或 vanilla_js
 */
const char *get_environment_name(script_environment env);

/**
 * @brief 静态扫描源代码，判断代码的运行环境，大小写不敏感
 * 浏览器特征优先于 Node.js 特征。
 */
script_environment detect_script_environment(const std::string &source);

/**
 * @brief 生成在 Node.js 中模拟浏览器 API 的脚本
 * 模拟的 document、window、alert、prompt、confirm、localStorage、sessionStorage
 * 被安装为全局对象，交互函数把调用打印到控制台。
 * @param html_fixture 若不为空，通过 document.documentElement.outerHTML 提供给用户代码
 */
std::string browser_shim(const std::optional<std::string> &html_fixture);

}  // namespace quest::engine
