#include "ValueParser.hpp"
#include "DriverErrors.hpp"
#include "StringUtils.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

[[noreturn]] void fail(const std::string& what, const std::string& text) {
    throw DecodeError("Cannot decode " + what + " from value: " + text);
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Reads exactly `count` digits at `pos`
bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (!is_digit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += count;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return month == 2 && is_leap_year(year) ? 29 : DAYS[month - 1];
}

Date read_date(const std::string& s, size_t& pos) {
    Date d;
    if (!read_digits(s, pos, 4, d.year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, d.month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, d.day)) {
        fail("date", s);
    }
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > days_in_month(d.year, d.month)) {
        fail("date", s);
    }
    return d;
}

void read_time(const std::string& s, size_t& pos, DateTime& dt) {
    if (!read_digits(s, pos, 2, dt.hour) || !expect(s, pos, ':') ||
        !read_digits(s, pos, 2, dt.minute) || !expect(s, pos, ':') ||
        !read_digits(s, pos, 2, dt.second)) {
        fail("timestamp", s);
    }
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) {
        fail("timestamp", s);
    }

    if (expect(s, pos, '.')) {
        size_t digits = 0;
        int micros = 0;
        while (pos < s.size() && is_digit(s[pos])) {
            if (digits < 6) micros = micros * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) fail("timestamp", s);
        for (size_t i = digits; i < 6; ++i) micros *= 10;
        dt.microsecond = micros;
    }
}

DateTime read_datetime(const std::string& s, size_t& pos) {
    DateTime dt;
    dt.date = read_date(s, pos);
    if (pos == s.size()) {
        return dt;
    }
    if (!expect(s, pos, ' ') && !expect(s, pos, 'T')) {
        fail("timestamp", s);
    }
    read_time(s, pos, dt);
    return dt;
}

// "Z", "+HH", "+HHMM" or "+HH:MM"; nothing means UTC
int read_offset(const std::string& s, size_t& pos) {
    expect(s, pos, ' ');
    if (pos == s.size() || expect(s, pos, 'Z')) {
        return 0;
    }
    const bool negative = s[pos] == '-';
    if (!expect(s, pos, '+') && !expect(s, pos, '-')) {
        fail("timestamptz", s);
    }
    int hours = 0;
    int minutes = 0;
    if (!read_digits(s, pos, 2, hours)) fail("timestamptz", s);
    if (pos < s.size()) {
        expect(s, pos, ':');
        if (!read_digits(s, pos, 2, minutes)) fail("timestamptz", s);
    }
    if (hours > 23 || minutes > 59) fail("timestamptz", s);
    const int seconds = hours * 3600 + minutes * 60;
    return negative ? -seconds : seconds;
}

const std::string& require_string(const nlohmann::json& raw, const char* what) {
    if (!raw.is_string()) fail(what, raw.dump());
    return raw.get_ref<const std::string&>();
}

}

Date ValueParser::parse_date(const std::string& text) {
    const std::string s = StringUtils::trimmed(text);
    size_t pos = 0;
    Date d = read_date(s, pos);
    if (pos != s.size()) fail("date", s);
    return d;
}

DateTime ValueParser::parse_datetime(const std::string& text) {
    const std::string s = StringUtils::trimmed(text);
    size_t pos = 0;
    DateTime dt = read_datetime(s, pos);
    if (pos != s.size()) fail("timestamp", s);
    return dt;
}

DateTimeTz ValueParser::parse_datetime_tz(const std::string& text, const std::string& zone) {
    const std::string s = StringUtils::trimmed(text);
    size_t pos = 0;
    DateTimeTz tz;
    tz.local = read_datetime(s, pos);
    tz.offset_seconds = read_offset(s, pos);
    if (pos != s.size()) fail("timestamptz", s);
    tz.zone = zone;
    return tz;
}

Bytes ValueParser::parse_bytea(const std::string& text) {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x') {
        fail("bytea", text);
    }
    try {
        return StringUtils::from_hex(std::string_view(text).substr(2));
    } catch (const std::invalid_argument& e) {
        throw DecodeError("Cannot decode bytea from value: " + text + " (" + e.what() + ")");
    }
}

Decimal ValueParser::parse_decimal(const std::string& text, int precision, int scale) {
    const std::string s = StringUtils::trimmed(text);
    size_t pos = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    size_t int_digits = 0;
    size_t frac_digits = 0;
    bool seen_dot = false;
    bool leading = true;
    size_t frac_trailing_zeros = 0;
    for (; pos < s.size(); ++pos) {
        const char c = s[pos];
        if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else if (is_digit(c)) {
            if (seen_dot) {
                ++frac_digits;
                frac_trailing_zeros = c == '0' ? frac_trailing_zeros + 1 : 0;
            } else if (!(leading && c == '0')) {
                leading = false;
                ++int_digits;
            }
        } else {
            fail("decimal", s);
        }
    }
    if (s.empty() || s.find_first_of("0123456789") == std::string::npos) {
        fail("decimal", s);
    }
    if (precision > 0) {
        const size_t significant_frac = frac_digits - frac_trailing_zeros;
        if (int_digits > static_cast<size_t>(precision - scale) ||
            significant_frac > static_cast<size_t>(scale)) {
            throw DecodeError(fmt::format("Value {} does not fit decimal({}, {})", s, precision, scale));
        }
    }
    return Decimal{Decimal{s}.normalized()};
}

ColValue ValueParser::parse_integer(const nlohmann::json& raw) {
    if (raw.is_number_unsigned()) {
        const auto value = raw.get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            fail("integer", raw.dump());
        }
        return static_cast<int64_t>(value);
    }
    if (raw.is_number_integer()) {
        return raw.get<int64_t>();
    }
    const std::string& text = require_string(raw, "integer");
    const size_t start = !text.empty() && (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (text.size() == start || text.find_first_not_of("0123456789", start) != std::string::npos) {
        fail("integer", text);
    }
    try {
        return static_cast<int64_t>(std::stoll(text));
    } catch (const std::out_of_range&) {
        throw DecodeError("Integer value out of range: " + text);
    }
}

ColValue ValueParser::parse_float(const nlohmann::json& raw) {
    if (raw.is_number()) {
        return raw.get<double>();
    }
    const std::string text = StringUtils::to_lower(require_string(raw, "float"));
    if (text == "inf" || text == "+inf" || text == "infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (text == "-inf" || text == "-infinity") {
        return -std::numeric_limits<double>::infinity();
    }
    if (text == "nan" || text == "+nan" || text == "-nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (text.empty()) fail("float", text);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        fail("float", text);
    }
    return value;
}

ColValue ValueParser::parse_boolean(const nlohmann::json& raw, const DecodeOptions& options) {
    if (raw.is_boolean()) {
        return raw.get<bool>();
    }
    if (raw.is_number_integer()) {
        const auto value = raw.get<int64_t>();
        if (value == 0 || value == 1) return value == 1;
        fail("boolean", raw.dump());
    }
    const std::string text = StringUtils::to_lower(require_string(raw, "boolean"));
    if (text == "true" || text == "1") return true;
    if (text == "false" || text == "0") return false;
    if (options.textual_bool()) {
        if (text == "t") return true;
        if (text == "f") return false;
    }
    fail("boolean", text);
}

ColValue ValueParser::parse_string(const nlohmann::json& raw) {
    if (raw.is_string()) {
        return raw.get<std::string>();
    }
    if (raw.is_array()) {
        fail("text", raw.dump());
    }
    return raw.dump();
}

ColValue ValueParser::parse(const nlohmann::json& raw, const DataType& type,
                            const DecodeOptions& options) {
    if (raw.is_null()) {
        return ColValue();
    }

    switch (type.tag) {
        case TypeTag::INTEGER:
            return parse_integer(raw);
        case TypeTag::FLOAT:
            return parse_float(raw);
        case TypeTag::DECIMAL:
            if (raw.is_number()) {
                return parse_decimal(raw.dump(), type.precision, type.scale);
            }
            return parse_decimal(require_string(raw, "decimal"), type.precision, type.scale);
        case TypeTag::STRING:
            return parse_string(raw);
        case TypeTag::BYTES:
            return parse_bytea(require_string(raw, "bytea"));
        case TypeTag::DATE:
            return parse_date(require_string(raw, "date"));
        case TypeTag::DATETIME:
            return parse_datetime(require_string(raw, "timestamp"));
        case TypeTag::DATETIME_TZ:
            return parse_datetime_tz(require_string(raw, "timestamptz"), options.time_zone);
        case TypeTag::BOOLEAN:
            return parse_boolean(raw, options);
        case TypeTag::ARRAY: {
            if (!raw.is_array()) {
                fail(type.name(), raw.dump());
            }
            const DataType element = type.element ? *type.element : DataType::of(TypeTag::STRING);
            ColArray values;
            values.reserve(raw.size());
            for (const auto& item : raw) {
                values.push_back(parse(item, element, options));
            }
            return values;
        }
    }
    fail(type.name(), raw.dump());
}
