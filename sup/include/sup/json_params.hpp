#pragma once

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace sup {

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
void param_from_json(T& x, const char* name, nlohmann::json& j) {
    if (auto o = find_and_remove_json<T>(name, j)) {
        x = *o;
    }
}

// Parse the JSON parameter file named on the command line.
inline nlohmann::json read_json_file(const std::string& fname) {
    std::ifstream f(fname);
    if (!f.good()) {
        throw std::runtime_error("unable to open input parameter file: "+fname);
    }
    nlohmann::json j;
    f >> j;
    return j;
}

} // namespace sup
