#include "ParameterFormatter.hpp"
#include "DriverErrors.hpp"
#include <cmath>

namespace {

bool is_decimal_text(const std::string& text) {
    size_t i = text[0] == '-' ? 1 : 0;
    bool digits = false;
    bool dot = false;
    for (; i < text.size(); ++i) {
        if (text[i] == '.' && !dot) {
            dot = true;
        } else if (text[i] >= '0' && text[i] <= '9') {
            digits = true;
        } else {
            return false;
        }
    }
    return digits;
}

}

std::string ParameterFormatter::quote_string(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (char c : text) {
        if (c == '\'') {
            out += "''";
        } else if (c == '\0') {
            out += '0';
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string ParameterFormatter::format_bytes(const Bytes& bytes) {
    std::string out = "E'";
    for (uint8_t b : bytes) {
        out += fmt::format("\\x{:02x}", b);
    }
    out += '\'';
    return out;
}

std::string ParameterFormatter::format_value(const ColValue& value) {
    return std::visit(
        [](auto&& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) return "'nan'";
                if (std::isinf(v)) return v > 0 ? "'inf'" : "'-inf'";
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, Decimal>) {
                std::string text = v.normalized();
                if (!is_decimal_text(text)) {
                    throw DataError("Invalid decimal parameter: " + v.value);
                }
                return text;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote_string(v);
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return format_bytes(v);
            } else if constexpr (std::is_same_v<T, ColArray>) {
                std::string out = "[";
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += format_value(v[i]);
                }
                return out + "]";
            } else {
                return "'" + v.to_iso() + "'";
            }
        },
        value.value);
}
