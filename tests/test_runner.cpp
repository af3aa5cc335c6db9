// Test runner: runs all unit test suites and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_delta_detector {
    bool run_all_tests();
}

namespace test_frame_sampler {
    bool run_all_tests();
}

namespace test_frame_buffer {
    bool run_all_tests();
}

namespace test_stream_config {
    bool run_all_tests();
}

namespace test_input_executor {
    bool run_all_tests();
}

namespace test_utils {
    bool run_all_tests();
}

namespace test_chrome_launch {
    bool run_all_tests();
}

namespace test_cdp_frame_source {
    bool run_all_tests();
}

namespace test_mcp_protocol {
    bool run_all_tests();
}

namespace test_tool_handlers {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main(int argc, char **argv) {
    std::vector<TestSuite> suites = {
        {"test_utils", test_utils::run_all_tests},
        {"test_delta_detector", test_delta_detector::run_all_tests},
        {"test_frame_sampler", test_frame_sampler::run_all_tests},
        {"test_frame_buffer", test_frame_buffer::run_all_tests},
        {"test_stream_config", test_stream_config::run_all_tests},
        {"test_input_executor", test_input_executor::run_all_tests},
        {"test_chrome_launch", test_chrome_launch::run_all_tests},
        {"test_cdp_frame_source", test_cdp_frame_source::run_all_tests},
        {"test_mcp_protocol", test_mcp_protocol::run_all_tests},
        {"test_tool_handlers", test_tool_handlers::run_all_tests},
    };

    // Optional filter: only suites whose name contains argv[1].
    std::string filter = argc > 1 ? argv[1] : "";

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== framesync Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        if (!filter.empty() && suite.name.find(filter) == std::string::npos) {
            continue;
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
