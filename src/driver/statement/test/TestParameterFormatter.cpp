#include "ParameterFormatter.hpp"
#include "DriverErrors.hpp"
#include <cassert>
#include <iostream>
#include <limits>

void test_scalars() {
    assert(ParameterFormatter::format_value(ColValue()) == "NULL");
    assert(ParameterFormatter::format_value(true) == "true");
    assert(ParameterFormatter::format_value(false) == "false");
    assert(ParameterFormatter::format_value(-42) == "-42");
    assert(ParameterFormatter::format_value(int64_t(9223372036854775807LL)) == "9223372036854775807");
    assert(ParameterFormatter::format_value(0.5) == "0.5");
    assert(ParameterFormatter::format_value(std::numeric_limits<double>::infinity()) == "'inf'");
    assert(ParameterFormatter::format_value(-std::numeric_limits<double>::infinity()) == "'-inf'");
    assert(ParameterFormatter::format_value(std::numeric_limits<double>::quiet_NaN()) == "'nan'");
    std::cout << "test_scalars passed" << std::endl;
}

void test_string_escaping() {
    assert(ParameterFormatter::format_value("plain") == "'plain'");
    assert(ParameterFormatter::format_value("it's") == "'it''s'");
    assert(ParameterFormatter::format_value(std::string("a\0b", 3)) == "'a0b'");
    assert(ParameterFormatter::format_value("") == "''");
    assert(ParameterFormatter::format_value("line\nbreak") == "'line\nbreak'");
    std::cout << "test_string_escaping passed" << std::endl;
}

void test_bytes() {
    assert(ParameterFormatter::format_value(Bytes{'a', '\n', 0xff}) == "E'\\x61\\x0a\\xff'");
    assert(ParameterFormatter::format_value(Bytes{}) == "E''");
    std::cout << "test_bytes passed" << std::endl;
}

void test_temporal() {
    assert(ParameterFormatter::format_value(Date{2021, 3, 4}) == "'2021-03-04'");
    assert(ParameterFormatter::format_value(DateTime{Date{2021, 3, 4}, 5, 6, 7, 800}) ==
           "'2021-03-04 05:06:07.000800'");
    DateTimeTz tz{DateTime{Date{2021, 3, 4}, 5, 6, 7, 0}, 3600, "Europe/Paris"};
    assert(ParameterFormatter::format_value(tz) == "'2021-03-04 05:06:07+01:00'");
    std::cout << "test_temporal passed" << std::endl;
}

void test_decimal() {
    assert(ParameterFormatter::format_value(Decimal{"0012.3400"}) == "12.34");
    assert(ParameterFormatter::format_value(Decimal{"-5"}) == "-5");

    bool caught = false;
    try {
        ParameterFormatter::format_value(Decimal{"1; DROP TABLE t"});
    } catch (const DataError&) {
        caught = true;
    }
    assert(caught);
    (void)caught;
    std::cout << "test_decimal passed" << std::endl;
}

void test_unsigned_integers() {
    assert(ParameterFormatter::format_value(uint32_t(4294967295u)) == "4294967295");
    assert(ParameterFormatter::format_value(uint64_t(9223372036854775807ULL)) == "9223372036854775807");
    assert(ColValue(uint64_t(9223372036854775807ULL)).is<int64_t>());

    ColValue max = std::numeric_limits<uint64_t>::max();
    assert(max.is<Decimal>());
    assert(ParameterFormatter::format_value(max) == "18446744073709551615");
    assert(ParameterFormatter::format_value(uint64_t(9223372036854775808ULL)) == "9223372036854775808");
    std::cout << "test_unsigned_integers passed" << std::endl;
}

void test_arrays() {
    assert(ParameterFormatter::format_value(ColArray{}) == "[]");
    assert(ParameterFormatter::format_value(ColArray{1, 2, nullptr}) == "[1, 2, NULL]");
    assert(ParameterFormatter::format_value(ColArray{ColArray{"a"}, ColArray{"b'c"}}) ==
           "[['a'], ['b''c']]");
    std::cout << "test_arrays passed" << std::endl;
}

int main() {
    test_scalars();
    test_string_escaping();
    test_bytes();
    test_temporal();
    test_decimal();
    test_unsigned_integers();
    test_arrays();

    std::cout << "All ParameterFormatter tests passed." << std::endl;
    return 0;
}
