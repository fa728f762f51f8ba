#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_access {

template <typename Key>
const json *step(const json *ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        return &ref->at(key);
    return nullptr;
}

template <typename... Keys>
const json *find(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = step(ref, keys)), ...);
    return ref;
}

}  // namespace detail_access

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = detail_access::find(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &, Keys &&... keys) {
    std::string msg = "Missing or unexpected value type of: ";
    bool first = true;
    ((msg += (first ? "" : ".") + boost::lexical_cast<std::string>(keys), first = false), ...);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = detail_access::find(j, keys...);
    if (!ref || ref->is_null())
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

}  // namespace nlohmann
