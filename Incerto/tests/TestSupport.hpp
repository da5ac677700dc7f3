#pragma once

#include <cmath>
#include <cstdlib>
#include <iostream>

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

// Evaluates expr and requires it to throw ExType (or a subclass).
#define REQUIRE_THROWS(expr, ExType, msg)                                       \
    do {                                                                        \
        bool thrown_ = false;                                                   \
        try {                                                                   \
            (void)(expr);                                                       \
        } catch (const ExType&) {                                               \
            thrown_ = true;                                                     \
        }                                                                       \
        REQUIRE(thrown_, msg);                                                  \
    } while (0)

static inline bool nearly(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

static inline void pass(const char* name) {
    std::cout << "[PASS] " << name << "\n";
}
