#pragma once

#include "ColType.hpp"
#include "DataType.hpp"
#include "RowSet.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Coerces raw JSON cells into typed values according to the declared column type
class ValueParser {
public:
    /**
     * @throws DecodeError If the raw value cannot be coerced to the type
     */
    static ColValue parse(const nlohmann::json& raw, const DataType& type,
                          const DecodeOptions& options = {});

    static Date parse_date(const std::string& text);
    static DateTime parse_datetime(const std::string& text);
    static DateTimeTz parse_datetime_tz(const std::string& text, const std::string& zone);

    // "\x0a1b" -> {0x0a, 0x1b}
    static Bytes parse_bytea(const std::string& text);

    static Decimal parse_decimal(const std::string& text, int precision, int scale);

private:
    static ColValue parse_integer(const nlohmann::json& raw);
    static ColValue parse_float(const nlohmann::json& raw);
    static ColValue parse_boolean(const nlohmann::json& raw, const DecodeOptions& options);
    static ColValue parse_string(const nlohmann::json& raw);
};
