#include "DataType.hpp"
#include "DriverErrors.hpp"
#include "StringUtils.hpp"
#include <array>
#include <utility>

namespace {

constexpr const char* NULLABLE_SUFFIX = " null";

const std::array<std::pair<const char*, TypeTag>, 26> TYPE_NAMES = {{
    {"int", TypeTag::INTEGER},
    {"integer", TypeTag::INTEGER},
    {"long", TypeTag::INTEGER},
    {"bigint", TypeTag::INTEGER},
    {"smallint", TypeTag::INTEGER},
    {"tinyint", TypeTag::INTEGER},
    {"float", TypeTag::FLOAT},
    {"double", TypeTag::FLOAT},
    {"double precision", TypeTag::FLOAT},
    {"real", TypeTag::FLOAT},
    {"text", TypeTag::STRING},
    {"string", TypeTag::STRING},
    {"varchar", TypeTag::STRING},
    {"date", TypeTag::DATE},
    {"pgdate", TypeTag::DATE},
    {"date_ext", TypeTag::DATE},
    {"datetime", TypeTag::DATETIME},
    {"timestamp", TypeTag::DATETIME},
    {"timestampntz", TypeTag::DATETIME},
    {"timestamp_ext", TypeTag::DATETIME},
    {"timestamptz", TypeTag::DATETIME_TZ},
    {"boolean", TypeTag::BOOLEAN},
    {"bool", TypeTag::BOOLEAN},
    {"bytea", TypeTag::BYTES},
    {"decimal", TypeTag::DECIMAL},
    {"numeric", TypeTag::DECIMAL},
}};

bool has_wrapper(const std::string& type, const std::string& prefix) {
    return type.size() > prefix.size() + 1 && type.compare(0, prefix.size(), prefix) == 0 &&
        type[prefix.size()] == '(' && type.back() == ')';
}

std::string unwrap(const std::string& type, const std::string& prefix) {
    return StringUtils::trimmed(type.substr(prefix.size() + 1, type.size() - prefix.size() - 2));
}

int parse_decimal_arg(const std::string& text, const std::string& raw_type) {
    const std::string arg = StringUtils::trimmed(text);
    if (arg.empty() || arg.size() > 3 || arg.find_first_not_of("0123456789") != std::string::npos) {
        throw DataError("Invalid decimal type arguments: " + raw_type);
    }
    return std::stoi(arg);
}

bool is_integer_name(const std::string& name) {
    // int4, int8, int32, int64, uint8 ...
    const std::string digits = "0123456789";
    if (name.rfind("uint", 0) == 0) {
        return name.size() > 4 && name.find_first_not_of(digits, 4) == std::string::npos;
    }
    if (name.rfind("int", 0) == 0) {
        return name.size() > 3 && name.find_first_not_of(digits, 3) == std::string::npos;
    }
    return false;
}

bool is_float_name(const std::string& name) {
    const std::string digits = "0123456789";
    return name.rfind("float", 0) == 0 && name.size() > 5 &&
        name.find_first_not_of(digits, 5) == std::string::npos;
}

}

DataType DataType::parse(const std::string& raw_type) {
    std::string type = StringUtils::to_lower(StringUtils::trimmed(raw_type));

    size_t depth = 0;
    for (char c : type) {
        if (c == '(') ++depth;
        if (c == ')') {
            if (depth == 0) throw DataError("Unbalanced parentheses in type: " + raw_type);
            --depth;
        }
    }
    if (depth != 0) {
        throw DataError("Unbalanced parentheses in type: " + raw_type);
    }

    const std::string suffix = NULLABLE_SUFFIX;
    if (type.size() > suffix.size() &&
        type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0) {
        DataType inner = parse(type.substr(0, type.size() - suffix.size()));
        inner.nullable = true;
        return inner;
    }

    if (has_wrapper(type, "nullable")) {
        DataType inner = parse(unwrap(type, "nullable"));
        inner.nullable = true;
        return inner;
    }

    if (has_wrapper(type, "array")) {
        return array_of(parse(unwrap(type, "array")));
    }

    for (const char* prefix : {"decimal", "numeric"}) {
        if (has_wrapper(type, prefix)) {
            const std::string args = unwrap(type, prefix);
            const size_t comma = args.find(',');
            DataType t = of(TypeTag::DECIMAL);
            t.precision = parse_decimal_arg(args.substr(0, comma), raw_type);
            t.scale = comma == std::string::npos ? 0 : parse_decimal_arg(args.substr(comma + 1), raw_type);
            if (t.precision == 0 || t.scale > t.precision) {
                throw DataError("Invalid decimal type arguments: " + raw_type);
            }
            return t;
        }
    }

    for (const auto& [name, tag] : TYPE_NAMES) {
        if (type == name) {
            DataType t = of(tag);
            if (tag == TypeTag::DECIMAL) {
                t.precision = DEFAULT_DECIMAL_PRECISION;
                t.scale = DEFAULT_DECIMAL_SCALE;
            }
            return t;
        }
    }

    if (is_integer_name(type)) return of(TypeTag::INTEGER);
    if (is_float_name(type)) return of(TypeTag::FLOAT);

    return of(TypeTag::STRING);
}

std::string DataType::name() const {
    std::string out;
    switch (tag) {
        case TypeTag::DECIMAL:
            out = "decimal(" + std::to_string(precision) + ", " + std::to_string(scale) + ")";
            break;
        case TypeTag::ARRAY:
            out = "array(" + (element ? element->name() : std::string("text")) + ")";
            break;
        default:
            out = to_string(tag);
            break;
    }
    return nullable ? out + NULLABLE_SUFFIX : out;
}

size_t DataType::array_depth() const {
    return tag == TypeTag::ARRAY && element ? element->array_depth() + 1 : 0;
}

bool operator==(const DataType& lhs, const DataType& rhs) {
    if (lhs.tag != rhs.tag || lhs.nullable != rhs.nullable) return false;
    if (lhs.tag == TypeTag::DECIMAL) {
        return lhs.precision == rhs.precision && lhs.scale == rhs.scale;
    }
    if (lhs.tag == TypeTag::ARRAY) {
        if (!lhs.element || !rhs.element) return lhs.element == rhs.element;
        return *lhs.element == *rhs.element;
    }
    return true;
}

const char* to_string(TypeTag tag) {
    switch (tag) {
        case TypeTag::INTEGER:     return "long";
        case TypeTag::FLOAT:       return "double";
        case TypeTag::DECIMAL:     return "decimal";
        case TypeTag::STRING:      return "text";
        case TypeTag::BYTES:       return "bytea";
        case TypeTag::DATE:        return "date";
        case TypeTag::DATETIME:    return "timestamp";
        case TypeTag::DATETIME_TZ: return "timestamptz";
        case TypeTag::BOOLEAN:     return "boolean";
        case TypeTag::ARRAY:       return "array";
    }
    return "unknown";
}
