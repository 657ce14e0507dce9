#pragma once

#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ybus/core/types.h"

/**
 * @brief Simple test framework
 */
class TestRunner {
  private:
    struct Test {
        std::string name;
        std::function<void()> test_func;
    };

    std::vector<Test> tests_;
    int passed_ = 0;
    int failed_ = 0;

  public:
    void add_test(std::string const& name, std::function<void()> test_func) {
        tests_.push_back({name, std::move(test_func)});
    }

    void run_all() {
        std::cout << "Running " << tests_.size() << " tests...\n" << std::endl;

        for (auto const& test : tests_) {
            try {
                std::cout << "Running " << test.name << "... ";
                test.test_func();
                std::cout << "PASSED" << std::endl;
                passed_++;
            } catch (std::exception const& e) {
                std::cout << "FAILED: " << e.what() << std::endl;
                failed_++;
            } catch (...) {
                std::cout << "FAILED: Unknown exception" << std::endl;
                failed_++;
            }
        }

        std::cout << "\nTest Results:" << std::endl;
        std::cout << "  Passed: " << passed_ << std::endl;
        std::cout << "  Failed: " << failed_ << std::endl;
        std::cout << "  Total:  " << tests_.size() << std::endl;
    }

    constexpr int get_failed_count() const noexcept { return failed_; }
};

// Test assertion macros
#define ASSERT_TRUE(condition)                                         \
    do {                                                               \
        if (!(condition)) {                                            \
            throw std::runtime_error("Assertion failed: " #condition); \
        }                                                              \
    } while (0)

#define ASSERT_FALSE(condition)                                                           \
    do {                                                                                  \
        if (condition) {                                                                  \
            throw std::runtime_error("Assertion failed: " #condition " should be false"); \
        }                                                                                 \
    } while (0)

// Helper functions for converting values to strings for assertions
template <typename T>
inline std::string assert_to_string(T const& val) {
    return std::to_string(val);
}

inline std::string assert_to_string(std::string const& val) { return "\"" + val + "\""; }

inline std::string assert_to_string(char const* val) { return std::string("\"") + val + "\""; }

inline std::string assert_to_string(ybus::ResolveMode const& val) {
    return ybus::resolve_mode_to_string(val);
}

inline std::string assert_to_string(ybus::Complex const& val) {
    return "(" + std::to_string(val.real()) + ", " + std::to_string(val.imag()) + ")";
}

#define ASSERT_EQ(expected, actual)                                                               \
    do {                                                                                          \
        if ((expected) != (actual)) {                                                             \
            throw std::runtime_error("Assertion failed: expected " + assert_to_string(expected) + \
                                     " but got " + assert_to_string(actual));                     \
        }                                                                                         \
    } while (0)

#define ASSERT_NEAR(expected, actual, tolerance)                                                \
    do {                                                                                        \
        if (std::abs((expected) - (actual)) > (tolerance)) {                                    \
            throw std::runtime_error("Assertion failed: expected " + assert_to_string(expected) + \
                                     " but got " + assert_to_string(actual) +                   \
                                     " (tolerance: " + std::to_string(tolerance) + ")");        \
        }                                                                                       \
    } while (0)

#define ASSERT_THROWS(statement, exception_type)                                              \
    do {                                                                                      \
        bool caught_expected = false;                                                         \
        try {                                                                                 \
            statement;                                                                        \
        } catch (exception_type const&) {                                                     \
            caught_expected = true;                                                           \
        }                                                                                     \
        if (!caught_expected) {                                                               \
            throw std::runtime_error("Assertion failed: " #statement " did not throw " #exception_type); \
        }                                                                                     \
    } while (0)
