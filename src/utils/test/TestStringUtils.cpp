#include "StringUtils.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

void test_case_conversion() {
    assert(StringUtils::to_lower("SELECT Url FROM Engines") == "select url from engines");
    assert(StringUtils::to_upper("ended_successfully") == "ENDED_SUCCESSFULLY");
    assert(StringUtils::to_lower("") == "");
    std::cout << "test_case_conversion passed" << std::endl;
}

void test_trim() {
    std::string s = " \t SET a = 1;\n ";
    StringUtils::trim(s);
    assert(s == "SET a = 1;");
    assert(StringUtils::trimmed("   ") == "");
    assert(StringUtils::trimmed("x") == "x");
    std::cout << "test_trim passed" << std::endl;
}

void test_case_insensitive_compare() {
    assert(StringUtils::iequals("Running", "RUNNING"));
    assert(!StringUtils::iequals("Running", "Runnin"));
    assert(StringUtils::istarts_with("Set time_zone = 'UTC'", "set"));
    assert(!StringUtils::istarts_with("se", "set"));
    assert(StringUtils::icontains("COPY INTO t CREDENTIALS = (AWS_KEY_ID = 'x')", "aws_key_id"));
    assert(StringUtils::icontains("anything", ""));
    assert(!StringUtils::icontains("SELECT 1", "credentials"));
    std::cout << "test_case_insensitive_compare passed" << std::endl;
}

void test_replace_all() {
    assert(StringUtils::replace_all("it's Bob's", "'", "''") == "it''s Bob''s");
    assert(StringUtils::replace_all("aaa", "a", "aa") == "aaaaaa");
    assert(StringUtils::replace_all("unchanged", "", "x") == "unchanged");
    std::cout << "test_replace_all passed" << std::endl;
}

void test_hex() {
    assert(StringUtils::to_hex({0x61, 0x0a, 0xff}) == "610aff");
    assert(StringUtils::to_hex({}) == "");
    assert((StringUtils::from_hex("610AfF") == std::vector<uint8_t>{0x61, 0x0a, 0xff}));

    try {
        StringUtils::from_hex("abc");
        assert(false);
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()) == "Hex string has odd length: 3");
    }
    try {
        StringUtils::from_hex("zz");
        assert(false);
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()) == "Invalid hex digit: z");
    }
    std::cout << "test_hex passed" << std::endl;
}

int main() {
    test_case_conversion();
    test_trim();
    test_case_insensitive_compare();
    test_replace_all();
    test_hex();
    std::cout << "All StringUtils tests passed!" << std::endl;
    return 0;
}
