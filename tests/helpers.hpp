#pragma once

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include <fmt/format.h>

static int g_fail_count = 0;

#define EXPECT_TRUE(cond, msg) do { \
    if (!(cond)) { \
        fmt::print(stderr, "[FAIL] {} (at {}:{})\n", msg, __FILE__, __LINE__); \
        g_fail_count++; \
    } \
} while(0)

#define EXPECT_EQ(val, exp, msg) do { \
    if (!((val) == (exp))) { \
        fmt::print(stderr, "[FAIL] {} got={} expected={} (at {}:{})\n", \
                   msg, (val), (exp), __FILE__, __LINE__); \
        g_fail_count++; \
    } \
} while(0)

#define EXPECT_CLOSE(val, exp, eps, msg) do { \
    if (std::fabs((val) - (exp)) > (eps)) { \
        fmt::print(stderr, "[FAIL] {} got={} expected={} tol={} (at {}:{})\n", \
                   msg, (val), (exp), (eps), __FILE__, __LINE__); \
        g_fail_count++; \
    } \
} while(0)

// Passes only when `stmt` throws exactly something catchable as `ExcType`.
#define EXPECT_THROWS(stmt, ExcType, msg) do { \
    bool _thrown = false; \
    try { \
        stmt; \
    } catch (const ExcType&) { \
        _thrown = true; \
    } \
    if (!_thrown) { \
        fmt::print(stderr, "[FAIL] {} expected {} (at {}:{})\n", \
                   msg, #ExcType, __FILE__, __LINE__); \
        g_fail_count++; \
    } \
} while(0)

#define TEST_HEADER(name) fmt::print("\n=== {} ===\n", name)

inline void expect_allclose(const std::vector<double>& a, const std::vector<double>& b, double eps, const char* msg) {
    EXPECT_TRUE(a.size() == b.size(), std::string(msg) + " size mismatch");
    size_t n = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; ++i) {
        EXPECT_CLOSE(a[i], b[i], eps, std::string(msg) + " idx=" + std::to_string(i));
    }
}

inline int report() {
    if (g_fail_count == 0) {
        fmt::print("\nALL TESTS PASSED\n");
        return 0;
    }
    fmt::print(stderr, "\nTESTS FAILED: {}\n", g_fail_count);
    return 1;
}
