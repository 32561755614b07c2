#include <yfib/fib.hpp>
#include <yfib/trace.hpp>

#include <algorithm>
#include <cinttypes>
#include <vector>

namespace yfib {

namespace {

void fill_cache(std::int64_t n, std::vector<std::uint64_t>& cache) {
    if (n < 2) {
        cache[0] = 0;
        cache[1] = 1;
        return;
    }
    fill_cache(n - 1, cache);

    cache[n] = cache[n - 1] + cache[n - 2];
}

std::uint64_t tail_recursive(std::int64_t n, std::uint64_t first, std::uint64_t second) {
    if (n == 0) {
        return first;
    }
    return tail_recursive(n - 1, second, first + second);
}

void power(Matrix2& f, std::int64_t n, MatrixStats& stats) {
    for (std::int64_t i = 2; i <= n; ++i) {
        multiply(f, kFibMatrix);
        ++stats.multiplies;
    }
}

void power_log(Matrix2& f, std::int64_t n, MatrixStats& stats) {
    if (n == 0 || n == 1) {
        return;
    }
    power_log(f, n / 2, stats);
    multiply(f, f);
    ++stats.multiplies;

    if (n % 2 != 0) {
        multiply(f, kFibMatrix);
        ++stats.multiplies;
    }
}

// Unsigned, so F(n) past the int64_t range wraps
std::uint64_t recursive(std::int64_t n) {
    if (n < 2) {
        return static_cast<std::uint64_t>(n);
    }
    return recursive(n - 1) + recursive(n - 2);
}

} // namespace

std::int64_t fib_recursive(std::int64_t n) {
    return static_cast<std::int64_t>(recursive(n));
}

std::int64_t fib_recursive_cache(std::int64_t n) {
    // The base case writes both cache[0] and cache[1], even for n == 0
    std::vector<std::uint64_t> cache(static_cast<size_t>(std::max<std::int64_t>(n + 1, 2)));
    fill_cache(n, cache);
    return static_cast<std::int64_t>(cache[n]);
}

std::int64_t fib_tail_recursive(std::int64_t n) {
    return static_cast<std::int64_t>(tail_recursive(n, 0, 1));
}

std::int64_t fib_iterative(std::int64_t n) {
    if (n == 0) {
        return 0;
    }
    std::uint64_t temp;
    std::uint64_t first = 0;
    std::uint64_t second = 1;
    for (std::int64_t i = 0; i < n - 1; ++i) {
        temp = second;
        second = first + second;
        first = temp;
    }
    return static_cast<std::int64_t>(second);
}

std::int64_t fib_power_matrix(std::int64_t n) {
    MatrixStats stats;
    return fib_power_matrix(n, stats);
}

std::int64_t fib_power_matrix(std::int64_t n, MatrixStats& stats) {
    if (n == 0) {
        return 0;
    }
    Matrix2 f = kFibMatrix;
    power(f, n - 1, stats);
    return static_cast<std::int64_t>(f.m[0][0]);
}

std::int64_t fib_power_matrix_log(std::int64_t n) {
    MatrixStats stats;
    return fib_power_matrix_log(n, stats);
}

std::int64_t fib_power_matrix_log(std::int64_t n, MatrixStats& stats) {
    if (n == 0) {
        return 0;
    }
    Matrix2 f = kFibMatrix;
    power_log(f, n - 1, stats);
    return static_cast<std::int64_t>(f.m[0][0]);
}

const char* algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::recursive: return "recursive";
        case Algorithm::recursive_cache: return "recursive-cache";
        case Algorithm::tail_recursive: return "tail-recursive";
        case Algorithm::iterative: return "iterative";
        case Algorithm::power_matrix: return "power-matrix";
        case Algorithm::power_matrix_log: return "power-matrix-log";
    }
    return "unknown";
}

const char* algorithm_complexity(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::recursive: return "O(2^n) time, O(n) stack";
        case Algorithm::recursive_cache: return "O(n) time, O(n) space + O(n) stack";
        case Algorithm::tail_recursive: return "O(n) time, O(n) stack without TCO";
        case Algorithm::iterative: return "O(n) time, O(1) space";
        case Algorithm::power_matrix: return "O(n) 2x2 products, O(1) space";
        case Algorithm::power_matrix_log: return "O(log n) 2x2 products, O(log n) stack";
    }
    return "";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    for (Algorithm algorithm : kAllAlgorithms) {
        if (name == algorithm_name(algorithm)) {
            return algorithm;
        }
    }
    return std::nullopt;
}

std::int64_t compute(Algorithm algorithm, std::int64_t n) {
    switch (algorithm) {
        case Algorithm::recursive: return fib_recursive(n);
        case Algorithm::recursive_cache: return fib_recursive_cache(n);
        case Algorithm::tail_recursive: return fib_tail_recursive(n);
        case Algorithm::iterative: return fib_iterative(n);
        case Algorithm::power_matrix: return fib_power_matrix(n);
        case Algorithm::power_matrix_log: return fib_power_matrix_log(n);
    }
    return fib_iterative(n);
}

std::optional<std::int64_t> fibonacci(Algorithm algorithm, std::int64_t n) {
    YFIB_FUNC();
    if (n < 0) {
        YFIB_WARN("%s: rejected negative index %" PRId64, algorithm_name(algorithm), n);
        return std::nullopt;
    }
    if (n > kMaxExactIndex) {
        YFIB_WARN("%s: F(%" PRId64 ") does not fit in int64_t", algorithm_name(algorithm), n);
        return std::nullopt;
    }
    std::int64_t result = compute(algorithm, n);
    YFIB_DEBUG("%s: F(%" PRId64 ") = %" PRId64, algorithm_name(algorithm), n, result);
    return result;
}

} // namespace yfib
