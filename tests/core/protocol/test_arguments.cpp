/*
================================================================================
Arguments - Unit Tests
================================================================================

Outbound arguments are stored pre-encoded; these tests pin the encoding of
each builder and the array rendering handed to engines.
================================================================================
*/

#include <iostream>
#include <string>
#include <cstdint>
#include <cstddef>
#include <limits>

#include "wireio/core/protocol/arguments.hpp"
#include "common/test_check.hpp"

using wireio::core::protocol::Arguments;


void test_scalar_encoding() {
    std::cout << "[TEST] Scalar encoding..." << std::endl;

    Arguments args;
    args.push("hi").push(42).push(std::int64_t{-7}).push(true).push(false).push_null();

    TEST_CHECK(args.size() == 6);
    TEST_CHECK_EQ(args[0], std::string("\"hi\""));
    TEST_CHECK_EQ(args[1], std::string("42"));
    TEST_CHECK_EQ(args[2], std::string("-7"));
    TEST_CHECK_EQ(args[3], std::string("true"));
    TEST_CHECK_EQ(args[4], std::string("false"));
    TEST_CHECK_EQ(args[5], std::string("null"));

    std::cout << "[TEST] OK\n";
}

void test_integer_widths() {
    std::cout << "[TEST] Integer widths..." << std::endl;

    Arguments args;
    args.push(std::size_t{3})
        .push(5u)
        .push(-9LL)
        .push(std::numeric_limits<std::uint64_t>::max())
        .push(std::numeric_limits<std::int64_t>::min())
        .push(static_cast<short>(-2));

    TEST_CHECK(args.size() == 6);
    TEST_CHECK_EQ(args[0], std::string("3"));
    TEST_CHECK_EQ(args[1], std::string("5"));
    TEST_CHECK_EQ(args[2], std::string("-9"));
    TEST_CHECK_EQ(args[3], std::string("18446744073709551615"));
    TEST_CHECK_EQ(args[4], std::string("-9223372036854775808"));
    TEST_CHECK_EQ(args[5], std::string("-2"));

    // bool keeps its own encoding
    args.push(true);
    TEST_CHECK_EQ(args.back(), std::string("true"));

    std::cout << "[TEST] OK\n";
}

void test_double_encoding() {
    std::cout << "[TEST] Double encoding..." << std::endl;

    Arguments args;
    args.push(0.1)
        .push(-2.5)
        .push(1e300)
        .push(std::numeric_limits<double>::quiet_NaN())
        .push(std::numeric_limits<double>::infinity())
        .push(-std::numeric_limits<double>::infinity());

    TEST_CHECK_EQ(args[0], std::string("0.1"));
    TEST_CHECK_EQ(args[1], std::string("-2.5"));
    TEST_CHECK_EQ(args[2], std::string("1e+300"));
    TEST_CHECK_EQ(args[3], std::string("null"));
    TEST_CHECK_EQ(args[4], std::string("null"));
    TEST_CHECK_EQ(args[5], std::string("null"));
    TEST_CHECK_EQ(args.to_json(), std::string("[0.1,-2.5,1e+300,null,null,null]"));

    std::cout << "[TEST] OK\n";
}

void test_string_escaping() {
    std::cout << "[TEST] String escaping..." << std::endl;

    Arguments args;
    args.push(std::string("say \"hi\"\n\\"));
    args.push(std::string("\x01"));

    TEST_CHECK_EQ(args[0], std::string(R"("say \"hi\"\n\\")"));
    TEST_CHECK_EQ(args[1], std::string(R"("\u0001")"));

    std::cout << "[TEST] OK\n";
}

void test_to_json() {
    std::cout << "[TEST] Array rendering..." << std::endl;

    Arguments empty;
    TEST_CHECK(empty.empty());
    TEST_CHECK_EQ(empty.to_json(), std::string("[]"));

    Arguments args{"a", "b"};
    args.push_raw(R"({"k":[1,2]})");
    TEST_CHECK_EQ(args.to_json(), std::string(R"(["a","b",{"k":[1,2]}])"));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

int main() {
    test_scalar_encoding();
    test_integer_widths();
    test_double_encoding();
    test_string_escaping();
    test_to_json();

    std::cout << "\n[ARGUMENTS TESTS PASSED]\n";
    return 0;
}
