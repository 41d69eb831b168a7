/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for uuidforge.
 *
 * @details
 * Provides ANSI-colored terminal output, exception-protected test execution and
 * assertion macros. A failing assertion records the failure and aborts the current
 * test by throwing `AssertionFailure`; any other escaping exception is recorded as a
 * failure of the test that raised it.
 */

#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace uuidforge::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/// Thrown by assertion primitives after the failure has been reported and counted.
class AssertionFailure : public std::runtime_error {
  public:
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (!(val1 == val2)) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

inline void assert_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that `func` throws an exception of type `E` (or derived from it).
 */
template <typename E>
void assert_throws(const std::function<void()>& func, const char* file, int line, const char* expr)
{
    try {
        func();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
                  << " threw an unexpected exception: " << e.what() << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
              << " did not throw" << std::endl;
    failed_count++;
    throw AssertionFailure();
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, const std::function<void()>& func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const AssertionFailure&) {
        // Already reported and counted by the assertion primitive.
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    } catch (const std::exception& e) {
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << " (uncaught: " << e.what() << ")"
                  << std::endl;
        failed_count++;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== uuidforge Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace uuidforge::test

// ============================================================================
// API Macros
// ============================================================================

#define ASSERT_EQ(a, b) uuidforge::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

#define ASSERT_NE(a, b) uuidforge::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

#define ASSERT_TRUE(a) uuidforge::test::assert_true((a), __FILE__, __LINE__, #a)

#define ASSERT_FALSE(a) uuidforge::test::assert_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that evaluating `expr` throws `exc_type` (or a subclass).
 */
#define ASSERT_THROWS(expr, exc_type)                                                              \
    uuidforge::test::assert_throws<exc_type>([&]() { (void)(expr); }, __FILE__, __LINE__,          \
                                             #expr " throws " #exc_type)

#define RUN_TEST(func_name) uuidforge::test::run(#func_name, func_name)
