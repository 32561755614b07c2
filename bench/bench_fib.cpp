// Microbenchmarks for each Fibonacci variant.
// Google Benchmark fits the complexity of every variant from its size range.

#include <benchmark/benchmark.h>
#include <yfib/fib.hpp>

template <yfib::Algorithm A>
static void BM_Fib(benchmark::State& state) {
    const auto n = static_cast<std::int64_t>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(yfib::compute(A, n));
    }
    state.SetComplexityN(state.range(0));
}

BENCHMARK_TEMPLATE(BM_Fib, yfib::Algorithm::recursive)
    ->DenseRange(2, 32, 6)->Complexity();
BENCHMARK_TEMPLATE(BM_Fib, yfib::Algorithm::recursive_cache)
    ->RangeMultiplier(4)->Range(4, 4096)->Complexity(benchmark::oN);
BENCHMARK_TEMPLATE(BM_Fib, yfib::Algorithm::tail_recursive)
    ->RangeMultiplier(4)->Range(4, 4096)->Complexity(benchmark::oN);
BENCHMARK_TEMPLATE(BM_Fib, yfib::Algorithm::iterative)
    ->RangeMultiplier(4)->Range(4, 1 << 16)->Complexity(benchmark::oN);
BENCHMARK_TEMPLATE(BM_Fib, yfib::Algorithm::power_matrix)
    ->RangeMultiplier(4)->Range(4, 1 << 16)->Complexity(benchmark::oN);
BENCHMARK_TEMPLATE(BM_Fib, yfib::Algorithm::power_matrix_log)
    ->RangeMultiplier(4)->Range(4, 1 << 16)->Complexity(benchmark::oLogN);

static void BM_MatrixMultiply(benchmark::State& state) {
    yfib::Matrix2 f = yfib::kFibMatrix;
    for (auto _ : state) {
        yfib::multiply(f, yfib::kFibMatrix);
        benchmark::DoNotOptimize(f);
    }
}
BENCHMARK(BM_MatrixMultiply);

BENCHMARK_MAIN();
