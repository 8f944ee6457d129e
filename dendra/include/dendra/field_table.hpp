#pragma once

#include <optional>
#include <string>
#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/mechinfo.hpp>

namespace dendra {

// Fixed-layout structure of arrays: one contiguous column of `width()` values
// for each field of a schema. The layout is set at construction; field values
// may change, the set of fields and the width may not.
//
// Columns are addressed by position: the declaration order in a mechanism's
// mechanism_info. find() maps a field name to its position.

class field_table {
public:
    using value_type = fvm_value_type;
    using size_type  = fvm_size_type;

    field_table() = default;

    // All fields zero-initialized.
    field_table(std::vector<std::string> names, size_type width);

    // Columns initialized to the field default values.
    field_table(const std::vector<mechanism_field_spec>& specs, size_type width);

    size_type width() const { return width_; }
    size_type num_fields() const { return size_type(names_.size()); }
    const std::vector<std::string>& names() const { return names_; }

    std::optional<size_type> find(const std::string& name) const;

    // Column by position.
    value_type* operator[](size_type field) { return data_.data() + std::size_t(field)*width_; }
    const value_type* operator[](size_type field) const { return data_.data() + std::size_t(field)*width_; }

private:
    std::vector<std::string> names_;
    size_type width_ = 0;
    std::vector<value_type> data_;
};

} // namespace dendra
