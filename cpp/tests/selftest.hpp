/*
  Framework-free selftest helpers.

  Each test executable includes this header, runs its checks through the
  expect_* helpers and returns finish(). Non-zero exit means failure.
*/

#pragma once

#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>

namespace pvperf {
namespace selftest {

inline int& fail_count() {
    static int count = 0;
    return count;
}

inline void fail(std::string_view msg) {
    ++fail_count();
    std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
    std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
    if (!v) fail(msg);
    else pass(msg);
}

inline void expect_eq(size_t a, size_t b, std::string_view msg) {
    if (a != b) {
        fail(msg);
        std::cerr << "  a: " << a << "\n";
        std::cerr << "  b: " << b << "\n";
    } else {
        pass(msg);
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
    if (a != b) {
        fail(msg);
        std::cerr << "  a: " << a << "\n";
        std::cerr << "  b: " << b << "\n";
    } else {
        pass(msg);
    }
}

inline void expect_near(double a, double b, double tol, std::string_view msg) {
    if (!(std::fabs(a - b) <= tol)) {
        fail(msg);
        std::cerr << "  a: " << a << "\n";
        std::cerr << "  b: " << b << "\n";
    } else {
        pass(msg);
    }
}

/// Passes when fn throws E
template<typename E>
void expect_throws(const std::function<void()>& fn, std::string_view msg) {
    try {
        fn();
    } catch (const E&) {
        pass(msg);
        return;
    } catch (const std::exception& e) {
        fail(msg);
        std::cerr << "  unexpected exception: " << e.what() << "\n";
        return;
    }
    fail(msg);
    std::cerr << "  no exception thrown\n";
}

inline int finish(std::string_view suite) {
    if (fail_count() == 0) {
        std::cerr << "[PASS] " << suite << "\n";
        return 0;
    }
    std::cerr << "[FAIL] " << suite << ": " << fail_count() << " failure(s)\n";
    return 1;
}

} // namespace selftest
} // namespace pvperf
