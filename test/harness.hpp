#pragma once

// =============================================================================
// harness.hpp — minimal test harness shared by the ptyrun test executables
// =============================================================================
//
// Each test file is its own executable: it calls runTest() for every case and
// returns finish() from main(), which is non-zero if anything failed.
//
// =============================================================================

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

static int g_total = 0, g_passed = 0, g_failed = 0;

#define XASSERT(cond)                                                       \
    do                                                                      \
    {                                                                       \
        if (!(cond))                                                        \
        {                                                                   \
            std::cerr << "  ASSERT FAILED: " #cond << " (line " << __LINE__ \
                      << ")" << std::endl;                                  \
            throw std::runtime_error("assertion failed");                   \
        }                                                                   \
    } while (0)

#define XASSERT_EQ(a, b)                                               \
    do                                                                 \
    {                                                                  \
        auto _a = (a);                                                 \
        auto _b = (b);                                                 \
        if (_a != _b)                                                  \
        {                                                              \
            std::cerr << "  ASSERT FAILED: " << #a << " == " << #b     \
                      << "\n    Got: [" << _a << "] Expected: [" << _b \
                      << "] (line " << __LINE__ << ")" << std::endl;   \
            throw std::runtime_error("assertion failed");              \
        }                                                              \
    } while (0)

static void runTest(const std::string &name, std::function<void()> fn)
{
    g_total++;
    try
    {
        fn();
        g_passed++;
        std::cout << "  PASS: " << name << std::endl;
    }
    catch (const std::exception &e)
    {
        g_failed++;
        std::cout << "  FAIL: " << name << " - " << e.what() << std::endl;
    }
}

static void banner(const std::string &title)
{
    std::cout << "============================================" << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "============================================" << std::endl;
}

static int finish()
{
    std::cout << "\n============================================" << std::endl;
    std::cout << "  Total: " << g_total << "  |  Passed: " << g_passed
              << "  |  Failed: " << g_failed << std::endl;
    std::cout << "============================================" << std::endl;
    return g_failed > 0 ? 1 : 0;
}
