#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace yfib {

// Largest n whose Fibonacci number fits in std::int64_t.
inline constexpr std::int64_t kMaxExactIndex = 92;

// Fixed 2x2 matrix of unsigned entries. Products wrap modulo 2^64, which is
// what makes the overflowed results of the matrix variants agree with the
// additive ones.
struct Matrix2 {
    std::uint64_t m[2][2];
};

inline constexpr Matrix2 kFibMatrix = {{{1, 1}, {1, 0}}};

// f = f * m. Safe when f and m are the same object.
inline void multiply(Matrix2& f, const Matrix2& m) {
    std::uint64_t x = f.m[0][0] * m.m[0][0] + f.m[0][1] * m.m[1][0];
    std::uint64_t y = f.m[0][0] * m.m[0][1] + f.m[0][1] * m.m[1][1];
    std::uint64_t z = f.m[1][0] * m.m[0][0] + f.m[1][1] * m.m[1][0];
    std::uint64_t w = f.m[1][0] * m.m[0][1] + f.m[1][1] * m.m[1][1];

    f.m[0][0] = x;
    f.m[0][1] = y;
    f.m[1][0] = z;
    f.m[1][1] = w;
}

// Instrumentation for the matrix variants.
struct MatrixStats {
    std::uint64_t multiplies = 0;
};

// All six variants compute F(n) with F(0) = 0 and F(1) = 1. None of them
// validates n: n must be non-negative, and past kMaxExactIndex the result
// wraps modulo 2^64. Use fibonacci() for a checked call.

// Exponential time. Impractical much beyond n = 40.
std::int64_t fib_recursive(std::int64_t n);

// Linear time, recursing down to the base case and filling an n+1 entry
// cache on the way back up. Stack depth is n.
std::int64_t fib_recursive_cache(std::int64_t n);

// Linear time accumulator recursion. C++ does not guarantee tail call
// elimination, so unoptimized builds use one stack frame per step.
std::int64_t fib_tail_recursive(std::int64_t n);

// Linear time, constant space. Returns 0 for n == 0 as a special case: the
// two-variable loop on its own would yield 1 there.
std::int64_t fib_iterative(std::int64_t n);

// Top-left entry of [[1,1],[1,0]]^(n-1), by n-2 successive multiplications.
std::int64_t fib_power_matrix(std::int64_t n);
std::int64_t fib_power_matrix(std::int64_t n, MatrixStats& stats);

// Top-left entry of [[1,1],[1,0]]^(n-1), by recursive halving.
std::int64_t fib_power_matrix_log(std::int64_t n);
std::int64_t fib_power_matrix_log(std::int64_t n, MatrixStats& stats);

enum class Algorithm {
    recursive,
    recursive_cache,
    tail_recursive,
    iterative,
    power_matrix,
    power_matrix_log,
};

inline constexpr std::array<Algorithm, 6> kAllAlgorithms = {
    Algorithm::recursive,
    Algorithm::recursive_cache,
    Algorithm::tail_recursive,
    Algorithm::iterative,
    Algorithm::power_matrix,
    Algorithm::power_matrix_log,
};

const char* algorithm_name(Algorithm algorithm);
const char* algorithm_complexity(Algorithm algorithm);
std::optional<Algorithm> parse_algorithm(std::string_view name);

// Unchecked dispatch to one of the variants above.
std::int64_t compute(Algorithm algorithm, std::int64_t n);

// Checked dispatch: std::nullopt when n is negative or F(n) would not fit in
// std::int64_t.
std::optional<std::int64_t> fibonacci(Algorithm algorithm, std::int64_t n);

} // namespace yfib
