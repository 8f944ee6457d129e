#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <dendra/field_table.hpp>
#include <dendra/mechinfo.hpp>

#include "util/span.hpp"

namespace dendra {

namespace {
template <typename Seq>
std::optional<std::size_t> index_of_name(const Seq& seq, const std::string& name) {
    for (auto i: util::count_along(seq)) {
        if (seq[i].name==name) return i;
    }
    return std::nullopt;
}
} // anonymous namespace

std::optional<std::size_t> mechanism_info::parameter_index(const std::string& name) const {
    return index_of_name(parameters, name);
}

std::optional<std::size_t> mechanism_info::state_index(const std::string& name) const {
    return index_of_name(state, name);
}

field_table::field_table(std::vector<std::string> names, size_type width):
    names_(std::move(names)),
    width_(width),
    data_(names_.size()*std::size_t(width), 0)
{}

field_table::field_table(const std::vector<mechanism_field_spec>& specs, size_type width):
    width_(width)
{
    names_.reserve(specs.size());
    data_.reserve(specs.size()*std::size_t(width));
    for (const auto& s: specs) {
        names_.push_back(s.name);
        data_.insert(data_.end(), width, s.default_value);
    }
}

std::optional<field_table::size_type> field_table::find(const std::string& name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it==names_.end()) return std::nullopt;
    return size_type(it-names_.begin());
}

} // namespace dendra
