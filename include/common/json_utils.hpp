#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace nlohmann {

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
