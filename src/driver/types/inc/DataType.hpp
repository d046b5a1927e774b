#pragma once

#include <memory>
#include <string>

enum class TypeTag {
    INTEGER,
    FLOAT,
    DECIMAL,
    STRING,
    BYTES,
    DATE,
    DATETIME,
    DATETIME_TZ,
    BOOLEAN,
    ARRAY
};

// Column type as declared by the engine in a result's metadata
struct DataType {
    TypeTag tag = TypeTag::STRING;
    int precision = 0;              // DECIMAL only
    int scale = 0;                  // DECIMAL only
    bool nullable = false;
    std::shared_ptr<const DataType> element;    // ARRAY only

    static constexpr int DEFAULT_DECIMAL_PRECISION = 38;
    static constexpr int DEFAULT_DECIMAL_SCALE = 9;

    /**
     * Parse a declared type string such as "int", "decimal(38, 3)",
     * "array(text null)" or "timestamptz null". Matching is case-insensitive;
     * unknown names map to STRING.
     * @throws DataError If parentheses are unbalanced or decimal arguments are invalid
     */
    static DataType parse(const std::string& raw_type);

    static DataType of(TypeTag tag) {
        DataType t;
        t.tag = tag;
        return t;
    }

    static DataType array_of(DataType element_type) {
        DataType t;
        t.tag = TypeTag::ARRAY;
        t.element = std::make_shared<const DataType>(std::move(element_type));
        return t;
    }

    // Canonical lowercase name, e.g. "array(decimal(38, 3) null)"
    std::string name() const;

    // Nesting depth, 0 for scalars
    size_t array_depth() const;
};

bool operator==(const DataType& lhs, const DataType& rhs);
inline bool operator!=(const DataType& lhs, const DataType& rhs) { return !(lhs == rhs); }

const char* to_string(TypeTag tag);
