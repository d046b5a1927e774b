#pragma once

#include "DataType.hpp"
#include <optional>
#include <string>
#include <vector>

// One projected output field of a result set
struct Column {
    std::string name;
    DataType type_code;
    std::optional<int> display_size;
    std::optional<int> internal_size;
    std::optional<int> precision;
    std::optional<int> scale;
    std::optional<bool> null_ok;

    static Column from_declared(std::string name, const std::string& declared_type) {
        Column col;
        col.name = std::move(name);
        col.type_code = DataType::parse(declared_type);
        if (col.type_code.tag == TypeTag::DECIMAL) {
            col.precision = col.type_code.precision;
            col.scale = col.type_code.scale;
        }
        if (col.type_code.nullable) {
            col.null_ok = true;
        }
        return col;
    }
};

inline bool operator==(const Column& lhs, const Column& rhs) {
    return lhs.name == rhs.name && lhs.type_code == rhs.type_code &&
        lhs.display_size == rhs.display_size && lhs.internal_size == rhs.internal_size &&
        lhs.precision == rhs.precision && lhs.scale == rhs.scale && lhs.null_ok == rhs.null_ok;
}

inline bool operator!=(const Column& lhs, const Column& rhs) { return !(lhs == rhs); }

using ColumnVector = std::vector<Column>;
