#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

// Script output and error text are multi-line, so both sides go on their own lines.
inline void expect_eq_str(const std::string& got, const std::string& want, const std::string& msg) {
    if (got != want) {
        die(msg + "\n--- got ---\n" + got + "\n--- want ---\n" + want);
    }
}

// Tests that need a kernel feature or a helper binary bail out with success.
inline int skip_all(const char* test, const std::string& why) {
    std::cerr << test << ": SKIPPED (" << why << ")" << std::endl;
    return 0;
}
