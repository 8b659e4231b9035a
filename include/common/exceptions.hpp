#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace quest {

struct quest_exception : std::exception {
    quest_exception();
    explicit quest_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const quest_exception &ex);

    const char *what() const noexcept override;

    const boost::stacktrace::stacktrace &trace() const;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎自身或者运行环境的错误
 * 比如工具链不存在、工作目录无法创建、命令模板配置错误。
 * 这类错误不会抛给调用方，而是转换为状态为 INTERNAL_ERROR 的执行结果。
 */
struct internal_error : public quest_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 请求的 (language, framework) 组合没有注册对应的 runner
 * 在创建工作目录之前抛出，因此不会产生任何副作用。
 */
struct unsupported_configuration : public quest_exception {
    explicit unsupported_configuration(const std::string &message);
};

/**
 * @brief 请求本身不合法，比如源代码为空或者附加文件名试图逃逸工作目录
 */
struct invalid_request : public quest_exception {
    explicit invalid_request(const std::string &message);
};

/**
 * @brief 执行池已满或者已经停止，请求未被接收
 */
struct admission_rejected : public quest_exception {
    explicit admission_rejected(const std::string &message);
};

}  // namespace quest
