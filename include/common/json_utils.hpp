#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace nlohmann {

namespace detail_access {
template <typename Key>
void step(const json *&ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        ref = &ref->at(key);
    else
        ref = nullptr;
}
}  // namespace detail_access

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    (detail_access::step(ref, keys), ...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    (detail_access::step(ref, keys), ...);
    return !ref ? json{} : *ref;
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
    const json *ref = j.is_null() ? nullptr : &j;
    (detail_access::step(ref, keys), ...);
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
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
