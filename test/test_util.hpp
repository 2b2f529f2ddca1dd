#pragma once

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static int g_fail_count = 0;
static int g_pass_count = 0;

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_EQ(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got %llu vs %llu)\n", \
                         __FILE__, __LINE__, #a, #b, \
                         (unsigned long long)_a, (unsigned long long)_b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_STR_EQ(a, b) \
    do { \
        std::string _a = (a); \
        std::string _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got \"%s\" vs \"%s\")\n", \
                         __FILE__, __LINE__, #a, #b, _a.c_str(), _b.c_str()); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

// Relative tolerance for values derived through exp()/log().
#define CHECK_NEAR(a, b, rel) \
    do { \
        double _a = (a); \
        double _b = (b); \
        double _tol = (rel) * std::fmax(std::fabs(_a), std::fabs(_b)); \
        if (!(std::fabs(_a - _b) <= _tol)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s ~= %s  (got %.17g vs %.17g)\n", \
                         __FILE__, __LINE__, #a, #b, _a, _b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define TEST_SUMMARY() \
    do { \
        std::fprintf(stderr, "%d passed, %d failed\n", g_pass_count, g_fail_count); \
    } while (0)
