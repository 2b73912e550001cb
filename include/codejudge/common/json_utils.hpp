#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include "codejudge/common/exceptions.hpp"

/**
 * 按照键路径访问 JSON 的帮助函数
 * 同时支持 nlohmann::json 和 nlohmann::ordered_json，
 * 题目的参数列表需要保持文档顺序，因此读取题目时使用 ordered_json。
 */
namespace codejudge {

template <typename JsonT, typename... Keys>
const JsonT *find_path(const JsonT &j, Keys &&... keys) {
    const JsonT *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->contains(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename JsonT, typename... Keys>
bool exists(const JsonT &j, Keys &&... keys) {
    const JsonT *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename JsonT, typename... Keys>
malformed_input_error build_malformed_input(const JsonT &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    auto append = [&msg](const auto &key) {
        msg += boost::lexical_cast<std::string>(key) + ".";
    };
    (append(keys), ...);
    msg += " in " + j.dump(2);
    return malformed_input_error(msg);
}

template <typename JsonT, typename... Keys>
const JsonT &access(const JsonT &j, Keys &&... keys) {
    const JsonT *ref = find_path(j, keys...);
    if (!ref)
        throw build_malformed_input(j, keys...);
    else
        return *ref;
}

template <typename T, typename JsonT, typename... Keys>
T get_value(const JsonT &j, Keys &&... keys) {
    const JsonT &res = access(j, keys...);
    try {
        return res.template get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_malformed_input(j, keys...);
    }
}

template <typename T, typename JsonT, typename... Keys>
T get_value_def(const JsonT &j, const T &def_value, Keys &&... keys) {
    const JsonT *res = find_path(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->template get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_malformed_input(j, keys...);
    }
}

}  // namespace codejudge
