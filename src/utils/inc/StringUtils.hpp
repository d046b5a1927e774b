#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(std::string_view str);

    static bool iequals(std::string_view lhs, std::string_view rhs);
    static bool istarts_with(std::string_view str, std::string_view prefix);
    static bool icontains(std::string_view str, std::string_view needle);

    static std::string replace_all(std::string str, std::string_view from, std::string_view to);

    // Lowercase hex without any prefix
    static std::string to_hex(const std::vector<uint8_t>& bytes);

    // Throws std::invalid_argument on odd length or a non-hex digit
    static std::vector<uint8_t> from_hex(std::string_view hex);
};
