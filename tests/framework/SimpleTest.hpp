#pragma once

#include <chrono>
#include <format>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::test {

class AssertionFailure : public std::runtime_error {
public:
    explicit AssertionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

[[noreturn]] inline void fail(std::string_view what, const char* file, int line) {
    throw AssertionFailure(std::format("Assertion failed: {} at {}:{}", what, file, line));
}

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void register_test(std::string name, std::function<void()> func) {
        tests_.push_back({std::move(name), std::move(func)});
    }

    // Runs every registered test, or only those whose name contains `filter`
    int run_all(const std::string& suite, std::string_view filter = {}) {
        int passed = 0;
        int failed = 0;
        int skipped = 0;

        std::cout << "\n=== TETHER " << suite << " ===\n" << std::endl;

        for (const auto& test : tests_) {
            if (!filter.empty() && test.name.find(filter) == std::string::npos) {
                ++skipped;
                continue;
            }

            auto start = std::chrono::steady_clock::now();
            std::string failure;
            try {
                test.func();
            } catch (const std::exception& e) {
                failure = e.what();
            } catch (...) {
                failure = "non-standard exception";
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start);

            if (failure.empty()) {
                std::cout << std::format("[PASS] {} ({} us)", test.name, elapsed.count()) << std::endl;
                ++passed;
            } else {
                std::cout << std::format("[FAIL] {} - {}", test.name, failure) << std::endl;
                ++failed;
            }
        }

        std::cout << std::format("\nResults: {} Passed, {} Failed", passed, failed);
        if (skipped > 0) std::cout << std::format(", {} Filtered", skipped);
        std::cout << "." << std::endl;
        return failed > 0 ? 1 : 0;
    }

    int run_all(const std::string& suite, int argc, char** argv) {
        return run_all(suite, argc > 1 ? std::string_view(argv[1]) : std::string_view{});
    }

private:
    struct TestEntry {
        std::string name;
        std::function<void()> func;
    };
    std::vector<TestEntry> tests_;
};

struct Registrar {
    Registrar(const char* name, std::function<void()> func) {
        TestRunner::instance().register_test(name, std::move(func));
    }
};

}  // namespace tether::test

#define TEST_CASE(name) \
    void name(); \
    static tether::test::Registrar reg_##name(#name, name); \
    void name()

#define ASSERT_TRUE(condition) \
    do { if (!(condition)) tether::test::fail(#condition, __FILE__, __LINE__); } while (0)

#define ASSERT_FALSE(condition) \
    do { if (condition) tether::test::fail(#condition " is true", __FILE__, __LINE__); } while (0)

#define ASSERT_EQ(a, b) \
    do { if ((a) != (b)) tether::test::fail(#a " == " #b, __FILE__, __LINE__); } while (0)

#define ASSERT_NE(a, b) \
    do { if ((a) == (b)) tether::test::fail(#a " != " #b, __FILE__, __LINE__); } while (0)
