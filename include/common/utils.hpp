#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 在 PATH 中查找可执行文件
 * 若 name 包含 '/'，则直接检查该路径是否可执行。
 * @param name 程序名或者程序路径
 * @param search_path 以 ':' 分隔的搜索路径，一般为 PATH 环境变量
 * @return 可执行文件的路径，找不到时返回空
 */
std::optional<std::filesystem::path> find_executable(const std::string &name, const std::string &search_path);

/**
 * @brief 将当前进程的环境变量与 overrides 合并，生成 execve 使用的 KEY=VALUE 列表
 */
std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides);
