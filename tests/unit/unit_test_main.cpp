#include <iostream>

#include "ybus/logging/log_config.h"

#include "test_framework.h"

// Forward declarations of test registration functions
void register_linked_sparse_tests(TestRunner& runner);
void register_sparse_builder_tests(TestRunner& runner);
void register_admittance_tests(TestRunner& runner);
void register_io_tests(TestRunner& runner);
void register_logging_tests(TestRunner& runner);

int main() {
    // Keep test output readable, log lines go to the in-memory buffer
    ybus::logging::LogConfig::forTesting();

    TestRunner runner;

    // Register all test suites
    register_linked_sparse_tests(runner);
    register_sparse_builder_tests(runner);
    register_admittance_tests(runner);
    register_io_tests(runner);
    register_logging_tests(runner);

    // Run all tests
    runner.run_all();

    return runner.get_failed_count();
}
