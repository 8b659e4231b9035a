#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace quest {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 写入文本文件，若父文件夹不存在则创建
 * @throw std::system_error 文件无法写入时抛出
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将字符串截断到最多 limit 字节，且不会在 UTF-8 多字节字符中间截断
 * @return 截断后的字符串长度
 */
std::size_t utf8_truncate(std::string &string, std::size_t limit);

/**
 * @brief 断言 subpath 一定不会逃逸出所在的文件夹
 * 用户提交的附加文件名会被拼接到工作目录下，如果文件名是绝对路径或者
 * 包含 ".." 路径项，写入时可能覆盖工作目录之外的文件。
 * @param subpath 被检查的文件名
 * @throw invalid_request 文件名不安全时抛出
 */
std::string assert_safe_path(const std::string &subpath);

time_t last_write_time(const std::filesystem::path &path);

void last_write_time(const std::filesystem::path &path, time_t time);

}  // namespace quest
