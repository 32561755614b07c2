#pragma once

#include <yfib/fib.hpp>
#include <yfib/timing.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace yfib {

struct BenchConfig {
    std::vector<Algorithm> algorithms;
    std::vector<std::int64_t> sizes;
    size_t repeat = 5;
    size_t iterations = 1000;
    size_t warmup = 1;
    // The naive variant is exponential; sizes above this are skipped for it
    std::int64_t naive_limit = 32;
    // Batch length for the naive variant, which costs ~3.5M additions at n = 32
    size_t naive_iterations = 10;
    // Stack depth bound for the cache and tail recursive variants
    std::int64_t recursion_limit = 10000;
};

struct BenchResult {
    Algorithm algorithm;
    std::int64_t n;
    std::int64_t value;
    TimerStats per_call;  // nanoseconds per call, one sample per batch
};

struct Mismatch {
    Algorithm algorithm;
    std::int64_t n;
    std::int64_t expected;
    std::int64_t actual;
};

std::vector<std::int64_t> default_sizes();

// Defaults for every field, with repeat/iterations/warmup/naive_iterations
// overridable through YFIB_BENCH_REPEAT, YFIB_BENCH_ITERATIONS,
// YFIB_BENCH_WARMUP and YFIB_BENCH_NAIVE_ITERATIONS. Values that are not
// plain non-negative decimal numbers are ignored with a warning.
BenchConfig config_from_env();

// Largest n the harness will run for the given algorithm.
std::int64_t size_limit(Algorithm algorithm, const BenchConfig& config);

// Calls per timed batch for the given algorithm.
size_t iterations_for(Algorithm algorithm, const BenchConfig& config);

std::string timer_label(Algorithm algorithm, std::int64_t n);

// Statistics in each result cover only the batches of that call. The same
// samples also go to TimerManager under timer_label().
std::vector<BenchResult> run_benchmarks(const BenchConfig& config);

// Compares every algorithm in config against fib_iterative for 0..max_n,
// each one stopping at its size_limit().
std::vector<Mismatch> verify_agreement(const BenchConfig& config, std::int64_t max_n);

std::string format_results(const std::vector<BenchResult>& results);

} // namespace yfib
