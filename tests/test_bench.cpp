#include <boost/ut.hpp>
#include <yfib/bench.hpp>
#include <cstdlib>
#include <string>

using namespace boost::ut;

namespace {

yfib::BenchConfig small_config() {
    yfib::BenchConfig config;
    config.algorithms.assign(yfib::kAllAlgorithms.begin(), yfib::kAllAlgorithms.end());
    config.sizes = {0, 10, 40, 64};
    config.repeat = 3;
    config.iterations = 10;
    config.warmup = 0;
    config.naive_limit = 20;
    config.recursion_limit = 50;
    return config;
}

} // namespace

suite bench_tests = [] {
    "default_sizes"_test = [] {
        auto sizes = yfib::default_sizes();
        expect(!sizes.empty());
        expect(sizes.front() == 1);
        expect(sizes.back() == 16384);
    };

    "config_from_env"_test = [] {
        setenv("YFIB_BENCH_REPEAT", "7", 1);
        setenv("YFIB_BENCH_ITERATIONS", "not-a-number", 1);
        setenv("YFIB_BENCH_NAIVE_ITERATIONS", "3", 1);
        auto config = yfib::config_from_env();
        expect(config.repeat == 7_u);
        expect(config.iterations == 1000_u);
        expect(config.naive_iterations == 3_u);
        expect(config.algorithms.size() == yfib::kAllAlgorithms.size());
        unsetenv("YFIB_BENCH_REPEAT");
        unsetenv("YFIB_BENCH_ITERATIONS");
        unsetenv("YFIB_BENCH_NAIVE_ITERATIONS");
    };

    "config_from_env_rejects_partial_numbers"_test = [] {
        for (const char* bad : {"-1", "7abc", " 7", "+7", "", "99999999999999999999999"}) {
            setenv("YFIB_BENCH_REPEAT", bad, 1);
            setenv("YFIB_BENCH_WARMUP", bad, 1);
            auto config = yfib::config_from_env();
            expect(config.repeat == 5_u) << "YFIB_BENCH_REPEAT=" << bad;
            expect(config.warmup == 1_u) << "YFIB_BENCH_WARMUP=" << bad;
        }
        unsetenv("YFIB_BENCH_REPEAT");
        unsetenv("YFIB_BENCH_WARMUP");
    };

    "iterations_for"_test = [] {
        auto config = small_config();
        config.naive_iterations = 2;
        expect(yfib::iterations_for(yfib::Algorithm::recursive, config) == 2_u);
        expect(yfib::iterations_for(yfib::Algorithm::recursive_cache, config) == 10_u);
        expect(yfib::iterations_for(yfib::Algorithm::power_matrix_log, config) == 10_u);
        expect(yfib::BenchConfig{}.naive_iterations < yfib::BenchConfig{}.iterations);
    };

    "size_limits"_test = [] {
        auto config = small_config();
        expect(yfib::size_limit(yfib::Algorithm::recursive, config) == 20);
        expect(yfib::size_limit(yfib::Algorithm::recursive_cache, config) == 50);
        expect(yfib::size_limit(yfib::Algorithm::tail_recursive, config) == 50);
        expect(yfib::size_limit(yfib::Algorithm::iterative, config) == INT64_MAX);
        expect(yfib::size_limit(yfib::Algorithm::power_matrix_log, config) == INT64_MAX);
    };

    "run_respects_limits"_test = [] {
        yfib::TimerManager::instance().clear();
        auto config = small_config();
        auto results = yfib::run_benchmarks(config);

        // recursive: 0, 10; cache and tail: 0, 10, 40; the other three: all four sizes
        expect(results.size() == 20_u);
        for (const auto& r : results) {
            expect(r.n <= yfib::size_limit(r.algorithm, config));
            expect(r.value == yfib::fib_iterative(r.n)) << yfib::timer_label(r.algorithm, r.n);
            expect(r.per_call.count == 3_ull) << yfib::timer_label(r.algorithm, r.n);
            expect(r.per_call.min <= r.per_call.max);
        }

        auto stats = yfib::TimerManager::instance().stats(yfib::timer_label(yfib::Algorithm::iterative, 64));
        expect(stats.has_value());
    };

    "stats_cover_only_this_run"_test = [] {
        auto config = small_config();
        config.algorithms = {yfib::Algorithm::iterative, yfib::Algorithm::recursive};
        config.sizes = {10, 10};

        // No clear() between runs: earlier samples under the same labels
        // must not leak into the returned statistics.
        for (int run = 0; run < 2; ++run) {
            auto results = yfib::run_benchmarks(config);
            expect(results.size() == 4_u);
            for (const auto& r : results) {
                expect(r.per_call.count == 3_ull) << yfib::timer_label(r.algorithm, r.n) << "run" << run;
            }
        }

        auto total = yfib::TimerManager::instance().stats(yfib::timer_label(yfib::Algorithm::iterative, 10));
        expect(total.has_value() && total->count >= 12_ull);
    };

    "run_nothing"_test = [] {
        auto config = small_config();
        config.repeat = 0;
        expect(yfib::run_benchmarks(config).empty());
    };

    "zero_iterations_skip_algorithm"_test = [] {
        auto config = small_config();
        config.iterations = 0;
        auto results = yfib::run_benchmarks(config);
        // Only the naive variant keeps a non-zero batch: sizes 0 and 10
        expect(results.size() == 2_u);
        for (const auto& r : results) {
            expect(r.algorithm == yfib::Algorithm::recursive);
        }

        config.naive_iterations = 0;
        expect(yfib::run_benchmarks(config).empty());
    };

    "timer_label"_test = [] {
        expect(yfib::timer_label(yfib::Algorithm::power_matrix_log, 128) == std::string("power-matrix-log n=128"));
    };

    "verify_agreement"_test = [] {
        auto config = small_config();
        config.recursion_limit = 10000;
        auto mismatches = yfib::verify_agreement(config, 200);
        expect(mismatches.empty()) << "mismatches:" << mismatches.size();
    };

    "format_results"_test = [] {
        yfib::BenchResult r{yfib::Algorithm::iterative, 10, 55, yfib::TimerStats{3, 12.0, 10.0, 14.0}};
        auto table = yfib::format_results({r});
        expect(table.find("algorithm") != std::string::npos) << table;
        expect(table.find("iterative") != std::string::npos) << table;
        expect(table.find("55") != std::string::npos) << table;
        expect(table.find("12.0 ns") != std::string::npos) << table;
    };
};

int main() {
    return 0;
}
