#pragma once

#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Minimal test assertion helpers (active in every build type)
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                           \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

#define TEST_CHECK_EQ(actual, expected)                                      \
    do {                                                                     \
        const auto& test_actual_ = (actual);                                 \
        const auto& test_expected_ = (expected);                             \
        if (!(test_actual_ == test_expected_)) {                             \
            std::cerr << "[TEST FAILED] " << #actual << " == " << #expected  \
                      << " (got '" << test_actual_ << "', expected '"        \
                      << test_expected_ << "')"                              \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)
