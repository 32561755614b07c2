// Basic usage example for yfib
#include <yfib/fib.hpp>
#include <yfib/trace.hpp>
#include <cinttypes>
#include <cstdio>
#include <iostream>

void print_table(std::int64_t n) {
    YFIB_TIMEIT("print_table");
    YFIB_FUNC();
    YFIB_INFO("printing F(%" PRId64 ") for every algorithm", n);

    for (auto algorithm : yfib::kAllAlgorithms) {
        auto value = yfib::fibonacci(algorithm, n);
        if (value) {
            std::printf("  %-18s F(%" PRId64 ") = %" PRId64 "\n", yfib::algorithm_name(algorithm), n, *value);
        } else {
            std::printf("  %-18s F(%" PRId64 ") rejected\n", yfib::algorithm_name(algorithm), n);
        }
    }
}

int main() {
    std::cout << "=== Basic yfib example ===\n\n";

    std::cout << "1. Running with default state (traces disabled):\n";
    print_table(20);

    std::cout << "\n2. Enabling all trace points:\n";
    YFIB_ENABLE_ALL();
    print_table(30);

    std::cout << "\n3. Out of range input is rejected with a warning:\n";
    YFIB_DISABLE_ALL();
    YFIB_ENABLE_LEVEL("warn");
    print_table(100);

    std::cout << "\n4. Counting 2x2 products for n = 1000000:\n";
    yfib::MatrixStats linear;
    yfib::MatrixStats halving;
    yfib::fib_power_matrix(1000000, linear);
    yfib::fib_power_matrix_log(1000000, halving);
    std::printf("  power-matrix     %" PRIu64 "\n", linear.multiplies);
    std::printf("  power-matrix-log %" PRIu64 "\n", halving.multiplies);

    std::cout << "\n5. Listing all registered trace points:\n";
    yfib::TraceManager::instance().for_each([](const yfib::TracePointInfo& info) {
        std::printf("  %s:%d [%s] [%s] -> %s\n",
            info.file, info.line, info.level, info.function,
            *info.enabled ? "ENABLED" : "disabled");
    });

    std::cout << "\n6. Timer summary:\n" << yfib::TimerManager::instance().summary();
    return 0;
}
