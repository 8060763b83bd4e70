// Test runner: runs all unit and protocol tests and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_json_rpc { bool run_all_tests(); }
namespace test_session_store { bool run_all_tests(); }
namespace test_cargo_requests { bool run_all_tests(); }
namespace test_cargo_command { bool run_all_tests(); }
namespace test_cargo_executor { bool run_all_tests(); }
namespace test_mcp_dispatch { bool run_all_tests(); }
namespace test_mcp_stdio { bool run_all_tests(); }

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main(int argc, char **argv) {
    std::vector<TestSuite> suites = {
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_session_store", test_session_store::run_all_tests},
        {"test_cargo_requests", test_cargo_requests::run_all_tests},
        {"test_cargo_command", test_cargo_command::run_all_tests},
        {"test_cargo_executor", test_cargo_executor::run_all_tests},
        {"test_mcp_dispatch", test_mcp_dispatch::run_all_tests},
        {"test_mcp_stdio", test_mcp_stdio::run_all_tests},
    };

    // Optional filter: run only the suites named on the command line.
    std::vector<std::string> selected(argv + 1, argv + argc);

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== CMCPS Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        if (!selected.empty()) {
            bool wanted = false;
            for (const auto &name : selected) {
                wanted = wanted || (name == suite.name);
            }
            if (!wanted) {
                continue;
            }
        }

        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
