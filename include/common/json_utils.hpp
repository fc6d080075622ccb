#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

template <typename Key>
const json *access_step(const json *ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        return &ref->at(key);
    return nullptr;
}

/**
 * @brief 沿着 keys 依次查找嵌套的字段
 * @return 字段不存在时返回 nullptr
 */
template <typename... Keys>
const json *access_pointer(const json &j, const Keys &... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = access_step(ref, keys)), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, const Keys &... keys) {
    const json *ref = access_pointer(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, const Keys &... keys) {
    const json *ref = access_pointer(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, const Keys &... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选字段，字段不存在、为 null 或类型不符时返回 def_value
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, const Keys &... keys) {
    const json *res = access_pointer(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        return def_value;
    }
}

}  // namespace nlohmann
