#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/ostream.h>
#include <iostream>
#include <limits>
#include <variant>
#include <string>
#include <vector>
#include <cstdint>
#include <type_traits>


// Exact numeric kept as text. Equality ignores insignificant zeros.
struct Decimal {
    std::string value;

    // Canonical text: no leading '+', no leading integer zeros,
    // no trailing fractional zeros, "-0" folded to "0"
    std::string normalized() const;
};

struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    std::string to_iso() const;     // YYYY-MM-DD
};

// Naive timestamp, microsecond resolution
struct DateTime {
    Date date;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;

    std::string to_iso() const;     // YYYY-MM-DD HH:MM:SS[.ffffff]
};

struct DateTimeTz {
    DateTime local;
    int offset_seconds = 0;         // east of UTC
    std::string zone;               // session time zone name, informational

    std::string to_iso() const;     // YYYY-MM-DD HH:MM:SS[.ffffff]+HH:MM

    // Microseconds since the Unix epoch of the represented instant
    int64_t epoch_micros() const;
};

using Bytes = std::vector<uint8_t>;

struct ColValue;
using ColArray = std::vector<ColValue>;

using ColVariant = std::variant<
    std::monostate,       // null
    bool,                 // boolean
    int64_t,              // int / long
    double,               // float / double
    Decimal,              // decimal(p, s)
    std::string,          // text
    Bytes,                // bytea
    Date,                 // date
    DateTime,             // timestamp / datetime
    DateTimeTz,           // timestamptz
    ColArray              // array(T)
>;

// A single cell or bound parameter value
struct ColValue {
    ColVariant value;

    ColValue() = default;
    ColValue(std::nullptr_t) {}
    ColValue(bool v) : value(v) {}

    // Unsigned values above INT64_MAX are kept exact as Decimal
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
    ColValue(T v) : value(from_integral(v)) {}

    ColValue(double v) : value(v) {}
    ColValue(float v) : value(static_cast<double>(v)) {}
    ColValue(const char* v) : value(std::string(v)) {}
    ColValue(std::string v) : value(std::move(v)) {}
    ColValue(Decimal v) : value(std::move(v)) {}
    ColValue(Bytes v) : value(std::move(v)) {}
    ColValue(Date v) : value(v) {}
    ColValue(DateTime v) : value(v) {}
    ColValue(DateTimeTz v) : value(std::move(v)) {}
    ColValue(ColArray v) : value(std::move(v)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(value); }

    template <typename T>
    const T& get() const { return std::get<T>(value); }

private:
    template <typename T>
    static ColVariant from_integral(T v) {
        if constexpr (std::is_unsigned_v<T>) {
            if (static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return ColVariant(std::in_place_type<Decimal>, Decimal{std::to_string(v)});
            }
        }
        return ColVariant(std::in_place_type<int64_t>, static_cast<int64_t>(v));
    }
};

using Row = std::vector<ColValue>;
using ParameterSet = std::vector<ColValue>;

bool operator==(const Decimal& lhs, const Decimal& rhs);
bool operator==(const Date& lhs, const Date& rhs);
bool operator==(const DateTime& lhs, const DateTime& rhs);
bool operator==(const DateTimeTz& lhs, const DateTimeTz& rhs);
bool operator==(const ColValue& lhs, const ColValue& rhs);

inline bool operator!=(const Decimal& lhs, const Decimal& rhs) { return !(lhs == rhs); }
inline bool operator!=(const Date& lhs, const Date& rhs) { return !(lhs == rhs); }
inline bool operator!=(const DateTime& lhs, const DateTime& rhs) { return !(lhs == rhs); }
inline bool operator!=(const DateTimeTz& lhs, const DateTimeTz& rhs) { return !(lhs == rhs); }
inline bool operator!=(const ColValue& lhs, const ColValue& rhs) { return !(lhs == rhs); }

// Bytes to "Bytes(\x..)" display text, used by the formatter below
std::string bytes_display(const Bytes& bytes);

template <>
struct fmt::formatter<ColValue> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const ColValue& column, FormatContext& ctx) const {
        return std::visit(
            [&](auto&& value) {
                using T = std::decay_t<decltype(value)>;
                auto out = ctx.out();
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return fmt::format_to(out, "NULL");
                } else if constexpr (std::is_same_v<T, bool>) {
                    return fmt::format_to(out, "{}", value ? "true" : "false");
                } else if constexpr (std::is_arithmetic_v<T>) {
                    return fmt::format_to(out, "{}", value);
                } else if constexpr (std::is_same_v<T, Decimal>) {
                    return fmt::format_to(out, "{}", value.value);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(out, "{}", value);
                } else if constexpr (std::is_same_v<T, Bytes>) {
                    return fmt::format_to(out, "{}", bytes_display(value));
                } else if constexpr (std::is_same_v<T, ColArray>) {
                    return fmt::format_to(out, "[{}]", fmt::join(value, ", "));
                } else {
                    return fmt::format_to(out, "{}", value.to_iso());
                }
            },
            column.value);
    }
};

inline std::ostream& operator<<(std::ostream& os, const ColValue& column) {
    fmt::print(os, "{}", column);
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const Row& row) {
    fmt::print(os, "[{}]", fmt::join(row, ", "));
    return os;
}
