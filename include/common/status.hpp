#pragma once

#include <string>

namespace quest {

/**
 * @brief 表示一次代码执行的最终结果
 * 每个被接收的执行请求都会且只会得到其中一个结果。
 */
enum class status {
    /**
     * @brief 所有步骤正常结束且返回值为 0
     * 若使用了测试框架，则还要求没有失败的测试用例。
     */
    SUCCESS = 0,

    /**
     * @brief 编译或者构建步骤失败
     * 对于解释型语言，若解释器报告语法错误且程序没有产生任何输出，也认为是编译错误。
     */
    COMPILE_ERROR = 1,

    /**
     * @brief 用户程序返回值非 0、因为信号崩溃，或者测试框架报告了失败的测试用例
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 用户程序运行时间超出限制，或者执行被取消
     */
    TIMEOUT = 3,

    /**
     * @brief 用户程序超出了 CPU 时间、文件大小等资源限制，或者持续大量输出
     */
    RESOURCE_EXCEEDED = 4,

    /**
     * @brief 内部错误，执行引擎自身或者运行环境出错
     * 比如工具链没有安装、工作目录无法创建。
     */
    INTERNAL_ERROR = 5
};

const char *get_display_message(status);

/**
 * @brief 获取结果在 JSON 中的表示，如 "compile_error"
 */
const char *get_status_name(status);

/**
 * @brief 根据 JSON 中的表示解析结果
 * @throw std::invalid_argument 若 name 不是合法的结果名
 */
status parse_status(const std::string &name);

}  // namespace quest
