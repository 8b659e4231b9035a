#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

/**
 * @brief 检查 json 对象中是否存在非 null 的路径 keys
 * @code{.cpp}
 *     exists(j, "limits", "cpuSeconds");
 * @endcode
 */
template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref && !ref->is_null();
}

/**
 * @brief 若 key 存在且不为 null，则读取到 value 中，否则 value 保持不变
 */
template <typename T>
void get_if_exists(const json &j, const std::string &key, T &value) {
    if (exists(j, key)) j.at(key).get_to(value);
}

template <typename T>
void get_if_exists(const json &j, const std::string &key, std::optional<T> &value) {
    if (exists(j, key)) value = j.at(key).get<T>();
}

}  // namespace nlohmann
