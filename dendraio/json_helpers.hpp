#pragma once

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include <dendraio/jsonio.hpp>

namespace dendraio {

// Search a json object for an entry with a given name.
// If found, return the value and remove from json object.
template <typename T>
std::optional<T> find_and_remove_json(const char* name, nlohmann::json& j) {
    auto it = j.find(name);
    if (it==j.end()) {
        return std::nullopt;
    }
    T value = it->template get<T>();
    j.erase(name);
    return value;
}

template <typename T>
T require_and_remove_json(const char* name, nlohmann::json& j) {
    if (auto value = find_and_remove_json<T>(name, j)) {
        return std::move(*value);
    }
    throw jsonio_missing_field(name);
}

inline void throw_if_not_empty(const nlohmann::json& j) {
    if (!j.empty()) {
        throw jsonio_unused_input(j.begin().key());
    }
}

} // namespace dendraio
