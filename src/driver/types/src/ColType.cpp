#include "ColType.hpp"
#include "StringUtils.hpp"
#include <cstdlib>

namespace {

// Days from 1970-01-01 to the given civil date (proleptic Gregorian)
int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

}

std::string Decimal::normalized() const {
    std::string text = value;
    StringUtils::trim(text);

    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        text.erase(0, 1);
    }

    std::string int_part = text;
    std::string frac_part;
    const size_t dot = text.find('.');
    if (dot != std::string::npos) {
        int_part = text.substr(0, dot);
        frac_part = text.substr(dot + 1);
    }

    const size_t first = int_part.find_first_not_of('0');
    int_part = first == std::string::npos ? "0" : int_part.substr(first);

    const size_t last = frac_part.find_last_not_of('0');
    frac_part = last == std::string::npos ? "" : frac_part.substr(0, last + 1);

    std::string out = int_part;
    if (!frac_part.empty()) {
        out += "." + frac_part;
    }
    if (negative && out != "0") {
        out.insert(out.begin(), '-');
    }
    return out;
}

std::string Date::to_iso() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::string DateTime::to_iso() const {
    std::string out = fmt::format("{} {:02d}:{:02d}:{:02d}", date.to_iso(), hour, minute, second);
    if (microsecond != 0) {
        out += fmt::format(".{:06d}", microsecond);
    }
    return out;
}

std::string DateTimeTz::to_iso() const {
    const int total = std::abs(offset_seconds);
    return fmt::format("{}{}{:02d}:{:02d}", local.to_iso(), offset_seconds < 0 ? '-' : '+',
                       total / 3600, (total % 3600) / 60);
}

int64_t DateTimeTz::epoch_micros() const {
    const int64_t days = days_from_civil(local.date.year, local.date.month, local.date.day);
    const int64_t seconds = days * 86400 + local.hour * 3600 + local.minute * 60 + local.second
        - offset_seconds;
    return seconds * 1000000 + local.microsecond;
}

bool operator==(const Decimal& lhs, const Decimal& rhs) {
    return lhs.normalized() == rhs.normalized();
}

bool operator==(const Date& lhs, const Date& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator==(const DateTime& lhs, const DateTime& rhs) {
    return lhs.date == rhs.date && lhs.hour == rhs.hour && lhs.minute == rhs.minute &&
        lhs.second == rhs.second && lhs.microsecond == rhs.microsecond;
}

// Same instant; the zone name is not part of the value
bool operator==(const DateTimeTz& lhs, const DateTimeTz& rhs) {
    return lhs.epoch_micros() == rhs.epoch_micros();
}

bool operator==(const ColValue& lhs, const ColValue& rhs) {
    return lhs.value == rhs.value;
}

std::string bytes_display(const Bytes& bytes) {
    return "\\x" + StringUtils::to_hex(bytes);
}
