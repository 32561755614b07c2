#include <yfib/bench.hpp>
#include <yfib/trace.hpp>

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace yfib {

namespace {

size_t env_or_default(const char* name, size_t fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    // stoul skips leading blanks, accepts a sign and stops at the first junk character
    if (*val < '0' || *val > '9') {
        YFIB_WARN("ignoring %s=%s: not a number", name, val);
        return fallback;
    }
    try {
        size_t pos = 0;
        unsigned long parsed = std::stoul(val, &pos);
        if (val[pos] != '\0') {
            YFIB_WARN("ignoring %s=%s: trailing characters", name, val);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        YFIB_WARN("ignoring %s=%s: out of range", name, val);
        return fallback;
    }
}

// Runs one batch and returns the mean cost of a single call in nanoseconds.
double time_batch(Algorithm algorithm, std::int64_t n, size_t iterations, std::int64_t& value) {
    volatile std::int64_t sink = 0;
    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        sink = compute(algorithm, n);
    }
    auto end = std::chrono::steady_clock::now();
    value = sink;
    double elapsed_ns = static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    return elapsed_ns / static_cast<double>(iterations);
}

} // namespace

std::vector<std::int64_t> default_sizes() {
    return {1, 2, 4, 8, 16, 32, 64, 128, 256, 512, 1024, 4096, 16384};
}

BenchConfig config_from_env() {
    BenchConfig config;
    config.algorithms.assign(kAllAlgorithms.begin(), kAllAlgorithms.end());
    config.sizes = default_sizes();
    config.repeat = env_or_default("YFIB_BENCH_REPEAT", config.repeat);
    config.iterations = env_or_default("YFIB_BENCH_ITERATIONS", config.iterations);
    config.warmup = env_or_default("YFIB_BENCH_WARMUP", config.warmup);
    config.naive_iterations = env_or_default("YFIB_BENCH_NAIVE_ITERATIONS", config.naive_iterations);
    return config;
}

std::int64_t size_limit(Algorithm algorithm, const BenchConfig& config) {
    switch (algorithm) {
        case Algorithm::recursive:
            return config.naive_limit;
        case Algorithm::recursive_cache:
        case Algorithm::tail_recursive:
            return config.recursion_limit;
        default:
            return INT64_MAX;
    }
}

size_t iterations_for(Algorithm algorithm, const BenchConfig& config) {
    return algorithm == Algorithm::recursive ? config.naive_iterations : config.iterations;
}

std::string timer_label(Algorithm algorithm, std::int64_t n) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s n=%" PRId64, algorithm_name(algorithm), n);
    return buf;
}

std::vector<BenchResult> run_benchmarks(const BenchConfig& config) {
    YFIB_TIMEIT("run_benchmarks");
    std::vector<BenchResult> results;
    if (config.repeat == 0) {
        YFIB_WARN("nothing to run: repeat=0");
        return results;
    }

    auto& timers = TimerManager::instance();
    for (Algorithm algorithm : config.algorithms) {
        size_t iterations = iterations_for(algorithm, config);
        if (iterations == 0) {
            YFIB_WARN("%s: skipped, 0 iterations per batch", algorithm_name(algorithm));
            continue;
        }
        YFIB_INFO("benchmarking %s (%zu calls per batch)", algorithm_name(algorithm), iterations);
        std::int64_t limit = size_limit(algorithm, config);

        for (std::int64_t n : config.sizes) {
            if (n < 0) {
                YFIB_WARN("skipping negative size %" PRId64, n);
                continue;
            }
            if (n > limit) {
                YFIB_DEBUG("%s: skipping n=%" PRId64 " (limit %" PRId64 ")", algorithm_name(algorithm), n, limit);
                continue;
            }

            std::int64_t value = 0;
            for (size_t w = 0; w < config.warmup; ++w) {
                time_batch(algorithm, n, iterations, value);
            }

            std::string label = timer_label(algorithm, n);
            TimerStats per_call;
            for (size_t r = 0; r < config.repeat; ++r) {
                double sample = time_batch(algorithm, n, iterations, value);
                add_sample(per_call, sample);
                timers.record(label, sample);
                YFIB_TRACE("%s batch %zu: %.1f ns/call", label.c_str(), r, sample);
            }

            results.push_back(BenchResult{algorithm, n, value, per_call});
        }
    }
    return results;
}

std::vector<Mismatch> verify_agreement(const BenchConfig& config, std::int64_t max_n) {
    YFIB_FUNC();
    std::vector<Mismatch> mismatches;
    for (std::int64_t n = 0; n <= max_n; ++n) {
        std::int64_t expected = fib_iterative(n);
        for (Algorithm algorithm : config.algorithms) {
            if (n > size_limit(algorithm, config)) continue;
            std::int64_t actual = compute(algorithm, n);
            if (actual != expected) {
                YFIB_ERROR("%s: F(%" PRId64 ") = %" PRId64 ", expected %" PRId64,
                           algorithm_name(algorithm), n, actual, expected);
                mismatches.push_back(Mismatch{algorithm, n, expected, actual});
            }
        }
    }
    return mismatches;
}

std::string format_results(const std::vector<BenchResult>& results) {
    std::ostringstream oss;
    char line[256];
    std::snprintf(line, sizeof(line), "%-18s %8s  %-22s %12s %12s %12s\n",
                  "algorithm", "n", "F(n)", "avg", "min", "max");
    oss << line;
    for (const auto& r : results) {
        std::snprintf(line, sizeof(line), "%-18s %8" PRId64 "  %-22" PRId64 " %12s %12s %12s\n",
                      algorithm_name(r.algorithm), r.n, r.value,
                      format_duration(r.per_call.avg).c_str(),
                      format_duration(r.per_call.min).c_str(),
                      format_duration(r.per_call.max).c_str());
        oss << line;
    }
    return oss.str();
}

} // namespace yfib
