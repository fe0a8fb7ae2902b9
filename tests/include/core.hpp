#pragma once

// =============================================================================
// WGC - Test Registration and Runner
// =============================================================================
//
// Tests register themselves at static-init time and run in declaration order.
//
//   WGC_TEST_BEGIN
//
//   WGC_TEST_UNIT(interns_in_first_seen_order) {
//       WGC_ASSERT_EQ(table.intern("a"), 0u);
//   }
//
//   WGC_TEST_SUITE(checkpoint)
//   WGC_TEST_CASE(commit_is_atomic) { ... }
//   WGC_TEST_SUITE_END
//
//   WGC_TEST_END
//   WGC_TEST_MAIN()
//
// Options:
//   --filter TEXT   run tests whose "suite::name" contains TEXT
//   --list          print the selected tests and exit
//   -x              stop after the first failure
//   -v              print per-test timings
//
// Exit status is 0 when every selected test passed.
// =============================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace wgc::test {

/// Thrown by a failed assertion. Anything else escaping a test is an error.
class AssertionFailure : public std::exception {
public:
    AssertionFailure(const char* file, int line, const std::string& what_failed,
                     const std::string& expected = {}, const std::string& actual = {}) {
        std::ostringstream out;
        out << file << ':' << line << ": " << what_failed;
        if (!expected.empty() || !actual.empty()) {
            out << "\n      expected " << expected << "\n      actual   " << actual;
        }
        text_ = out.str();
    }

    const char* what() const noexcept override { return text_.c_str(); }

private:
    std::string text_;
};

struct TestCase {
    void (*body)();
    const char* name;
    const char* suite;
    const char* file;
    int line;

    std::string label() const { return suite ? std::string(suite) + "::" + name : std::string(name); }
};

namespace detail {

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> cases;
    return cases;
}

// Suite of the tests being registered; set and cleared by the suite macros.
inline const char*& open_suite() {
    static const char* suite = nullptr;
    return suite;
}

inline bool add(void (*body)(), const char* name, const char* file, int line) {
    registry().push_back({body, name, open_suite(), file, line});
    return true;
}

template <typename T>
concept Printable = requires(std::ostream& os, const T& v) { os << v; };

template <typename T>
std::string show(const T& v) {
    std::ostringstream out;
    out << std::boolalpha << std::setprecision(17);
    if constexpr (std::is_enum_v<T>) {
        out << static_cast<long long>(v);
    } else if constexpr (Printable<T>) {
        out << v;
    } else {
        out << '<' << sizeof(T) << "-byte value>";
    }
    return out.str();
}

inline std::string show(const std::string& v) { return '"' + v + '"'; }
inline std::string show(const char* v) { return v ? '"' + std::string(v) + '"' : std::string("nullptr"); }

} // namespace detail

struct Options {
    std::string filter;
    bool list = false;
    bool stop_on_failure = false;
    bool timings = false;
};

/// @return exit code to return immediately, or -1 to go on and run
inline int parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--filter" && i + 1 < argc) {
            opts.filter = argv[++i];
        } else if (arg.rfind("--filter=", 0) == 0) {
            opts.filter = arg.substr(9);
        } else if (arg == "--list") {
            opts.list = true;
        } else if (arg == "-x" || arg == "--fail-fast") {
            opts.stop_on_failure = true;
        } else if (arg == "-v") {
            opts.timings = true;
        } else {
            std::fprintf(stderr, "usage: %s [--filter TEXT] [--list] [-x] [-v]\n", argv[0]);
            return arg == "-h" || arg == "--help" ? 0 : 2;
        }
    }
    return -1;
}

inline int run_all(const Options& opts) {
    std::vector<const TestCase*> selected;
    for (const TestCase& t : detail::registry()) {
        if (opts.filter.empty() || t.label().find(opts.filter) != std::string::npos) {
            selected.push_back(&t);
        }
    }

    if (opts.list) {
        for (const TestCase* t : selected) {
            std::printf("%s (%s:%d)\n", t->label().c_str(), t->file, t->line);
        }
        return 0;
    }

    std::size_t failed = 0;
    const auto start = std::chrono::steady_clock::now();
    for (const TestCase* t : selected) {
        const auto t0 = std::chrono::steady_clock::now();
        const char* verdict = "ok";
        std::string detail;
        try {
            t->body();
        } catch (const AssertionFailure& e) {
            verdict = "FAIL";
            detail = e.what();
        } catch (const std::exception& e) {
            verdict = "ERROR";
            detail = std::string("uncaught exception: ") + e.what();
        }
        const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

        std::printf("%-5s %s", verdict, t->label().c_str());
        if (opts.timings) {
            std::printf("  %.1f ms", ms);
        }
        std::printf("\n");
        if (!detail.empty()) {
            ++failed;
            std::printf("      %s\n", detail.c_str());
            if (opts.stop_on_failure) {
                break;
            }
        }
    }
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::printf("%zu tests, %zu failed (%.2f s)\n", selected.size(), failed, secs);
    return failed == 0 ? 0 : 1;
}

} // namespace wgc::test

// =============================================================================
// Assertions
// =============================================================================

#define WGC_FAIL(msg) throw ::wgc::test::AssertionFailure(__FILE__, __LINE__, msg)

#define WGC_ASSERT_TRUE(expr) \
    do { if (!(expr)) WGC_FAIL("expected true: " #expr); } while (0)

#define WGC_ASSERT_FALSE(expr) \
    do { if (expr) WGC_FAIL("expected false: " #expr); } while (0)

#define WGC_TEST_COMPARE(a, b, op) \
    do { \
        const auto& wgc_a_ = (a); \
        const auto& wgc_b_ = (b); \
        if (!(wgc_a_ op wgc_b_)) { \
            throw ::wgc::test::AssertionFailure(__FILE__, __LINE__, #a " " #op " " #b, \
                ::wgc::test::detail::show(wgc_a_), ::wgc::test::detail::show(wgc_b_)); \
        } \
    } while (0)

#define WGC_ASSERT_EQ(a, b) WGC_TEST_COMPARE(a, b, ==)
#define WGC_ASSERT_NE(a, b) WGC_TEST_COMPARE(a, b, !=)
#define WGC_ASSERT_LT(a, b) WGC_TEST_COMPARE(a, b, <)
#define WGC_ASSERT_LE(a, b) WGC_TEST_COMPARE(a, b, <=)
#define WGC_ASSERT_GT(a, b) WGC_TEST_COMPARE(a, b, >)
#define WGC_ASSERT_GE(a, b) WGC_TEST_COMPARE(a, b, >=)

#define WGC_ASSERT_NEAR(expected, actual, tol) \
    do { \
        const double wgc_e_ = static_cast<double>(expected); \
        const double wgc_a_ = static_cast<double>(actual); \
        const double wgc_t_ = static_cast<double>(tol); \
        if (!(std::abs(wgc_e_ - wgc_a_) <= wgc_t_)) { \
            throw ::wgc::test::AssertionFailure(__FILE__, __LINE__, #actual " within " #tol " of " #expected, \
                ::wgc::test::detail::show(wgc_e_), ::wgc::test::detail::show(wgc_a_)); \
        } \
    } while (0)

#define WGC_ASSERT_STR_EQ(expected, actual) WGC_ASSERT_EQ(std::string(expected), std::string(actual))

#define WGC_ASSERT_STR_CONTAINS(text, part) \
    do { \
        const std::string wgc_text_((text)); \
        const std::string wgc_part_((part)); \
        if (wgc_text_.find(wgc_part_) == std::string::npos) { \
            throw ::wgc::test::AssertionFailure(__FILE__, __LINE__, #text " contains " #part, \
                ::wgc::test::detail::show(wgc_part_), ::wgc::test::detail::show(wgc_text_)); \
        } \
    } while (0)

// An exception of another type escapes and fails the test as ERROR.
#define WGC_ASSERT_THROWS(expr, ExceptionType) \
    do { \
        bool wgc_thrown_ = false; \
        try { \
            expr; \
        } catch (const ExceptionType&) { \
            wgc_thrown_ = true; \
        } \
        if (!wgc_thrown_) WGC_FAIL(#expr " did not throw " #ExceptionType); \
    } while (0)

#define WGC_ASSERT_NO_THROW(expr) \
    do { \
        try { \
            expr; \
        } catch (const std::exception& wgc_e_) { \
            WGC_FAIL(std::string(#expr " threw: ") + wgc_e_.what()); \
        } \
    } while (0)

// =============================================================================
// Registration
// =============================================================================

#define WGC_TEST_BEGIN namespace {
#define WGC_TEST_END }

#define WGC_TEST_UNIT(name) \
    void wgc_test_##name(); \
    [[maybe_unused]] const bool wgc_registered_##name = \
        ::wgc::test::detail::add(&wgc_test_##name, #name, __FILE__, __LINE__); \
    void wgc_test_##name()

#define WGC_TEST_CASE(name) WGC_TEST_UNIT(name)

#define WGC_TEST_SUITE(name) \
    namespace wgc_suite_##name { \
    [[maybe_unused]] const bool wgc_suite_open_ = (::wgc::test::detail::open_suite() = #name, true);

#define WGC_TEST_SUITE_END \
    [[maybe_unused]] const bool wgc_suite_close_ = (::wgc::test::detail::open_suite() = nullptr, true); \
    }

#define WGC_TEST_MAIN() \
    int main(int argc, char* argv[]) { \
        ::wgc::test::Options wgc_opts; \
        const int wgc_rc = ::wgc::test::parse_options(argc, argv, wgc_opts); \
        return wgc_rc >= 0 ? wgc_rc : ::wgc::test::run_all(wgc_opts); \
    }
