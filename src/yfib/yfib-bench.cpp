#include <args/args.hxx>
#include <yfib/bench.hpp>
#include <yfib/fib.hpp>
#include <yfib/trace.hpp>

#include <cinttypes>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

// Resolve --algorithm names, defaulting to every variant
std::vector<yfib::Algorithm> select_algorithms(const std::vector<std::string>& names) {
    std::vector<yfib::Algorithm> selected;
    if (names.empty()) {
        selected.assign(yfib::kAllAlgorithms.begin(), yfib::kAllAlgorithms.end());
        return selected;
    }
    for (const auto& name : names) {
        auto algorithm = yfib::parse_algorithm(name);
        if (!algorithm) {
            throw args::ValidationError("Unknown algorithm: " + name + " (see 'yfib-bench list')");
        }
        selected.push_back(*algorithm);
    }
    return selected;
}

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("yfib-bench - Compare Fibonacci algorithms");
    parser.Prog("yfib-bench");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"}, args::Options::Global);

    args::ValueFlagList<std::string> algo_flag(parser, "NAME", "Algorithm to run (repeatable, default: all)", {'a', "algorithm"}, {}, args::Options::Global);
    args::ValueFlagList<long long> size_flag(parser, "N", "Input size (repeatable)", {'n', "size"}, {}, args::Options::Global);
    args::ValueFlag<size_t> repeat_flag(parser, "COUNT", "Timed batches per size", {'r', "repeat"}, args::Options::Global);
    args::ValueFlag<size_t> iter_flag(parser, "COUNT", "Calls per batch", {'i', "iterations"}, args::Options::Global);
    args::ValueFlag<long long> naive_flag(parser, "N", "Largest size for the exponential variant", {"naive-limit"}, args::Options::Global);
    args::ValueFlag<size_t> naive_iter_flag(parser, "COUNT", "Calls per batch for the exponential variant", {"naive-iterations"}, args::Options::Global);
    args::ValueFlag<long long> recursion_flag(parser, "N", "Largest size for the recursive linear variants", {"recursion-limit"}, args::Options::Global);
    args::Flag verbose_flag(parser, "verbose", "Print info and warning traces", {'v', "verbose"}, args::Options::Global);
    args::Flag trace_flag(parser, "trace", "Enable every trace point", {"trace"}, args::Options::Global);

    args::Group commands(parser, "Commands:");
    args::Command list_cmd(commands, "list", "List available algorithms");
    args::Command compute_cmd(commands, "compute", "Print F(n) from each algorithm for the given sizes");
    args::Command run_cmd(commands, "run", "Time each algorithm over the given sizes");
    args::Command verify_cmd(commands, "verify", "Check that all algorithms agree up to the largest size");

    parser.RequireCommand(false);

    std::vector<yfib::Algorithm> algorithms;
    try {
        parser.ParseCLI(argc, argv);
        algorithms = select_algorithms(args::get(algo_flag));
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (trace_flag) {
        YFIB_ENABLE_ALL();
    } else if (verbose_flag) {
        YFIB_ENABLE_LEVEL("info");
        YFIB_ENABLE_LEVEL("warn");
        YFIB_ENABLE_LEVEL("error");
    }

    std::vector<std::int64_t> sizes;
    for (long long n : args::get(size_flag)) {
        sizes.push_back(static_cast<std::int64_t>(n));
    }

    if (list_cmd) {
        for (auto algorithm : yfib::kAllAlgorithms) {
            std::printf("  %-18s %s\n", yfib::algorithm_name(algorithm), yfib::algorithm_complexity(algorithm));
        }
        return 0;
    }

    if (compute_cmd) {
        if (sizes.empty()) {
            std::cerr << "Error: No size specified. Use --size.\n";
            return 1;
        }
        int status = 0;
        for (auto n : sizes) {
            for (auto algorithm : algorithms) {
                auto value = yfib::fibonacci(algorithm, n);
                if (value) {
                    std::printf("%-18s F(%" PRId64 ") = %" PRId64 "\n", yfib::algorithm_name(algorithm), n, *value);
                } else {
                    std::printf("%-18s F(%" PRId64 ") = out of range (0..%" PRId64 ")\n",
                                yfib::algorithm_name(algorithm), n, yfib::kMaxExactIndex);
                    status = 1;
                }
            }
        }
        return status;
    }

    yfib::BenchConfig config = yfib::config_from_env();
    config.algorithms = algorithms;
    if (!sizes.empty()) config.sizes = sizes;
    if (repeat_flag) config.repeat = args::get(repeat_flag);
    if (iter_flag) config.iterations = args::get(iter_flag);
    if (naive_flag) config.naive_limit = args::get(naive_flag);
    if (naive_iter_flag) config.naive_iterations = args::get(naive_iter_flag);
    if (recursion_flag) config.recursion_limit = args::get(recursion_flag);

    if (verify_cmd) {
        std::int64_t max_n = yfib::kMaxExactIndex;
        for (auto n : sizes) {
            if (n > max_n) max_n = n;
        }
        auto mismatches = yfib::verify_agreement(config, max_n);
        if (mismatches.empty()) {
            std::printf("OK: %zu algorithm(s) agree for n = 0..%" PRId64 "\n", config.algorithms.size(), max_n);
            return 0;
        }
        for (const auto& m : mismatches) {
            std::printf("MISMATCH %-18s F(%" PRId64 ") = %" PRId64 ", expected %" PRId64 "\n",
                        yfib::algorithm_name(m.algorithm), m.n, m.actual, m.expected);
        }
        return 1;
    }

    if (run_cmd) {
        auto results = yfib::run_benchmarks(config);
        if (results.empty()) {
            std::cout << "No benchmarks ran.\n";
            return 0;
        }
        std::cout << yfib::format_results(results);
        return 0;
    }

    std::cout << parser;
    return 0;
}
