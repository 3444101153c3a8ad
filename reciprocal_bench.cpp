/**
 *  @brief Benchmarking serial and parallel reciprocal sums
 *  @file reciprocal_bench.cpp
 *  @date 19/10/2026
 */
#include <cmath>      // `std::abs`
#include <cstdlib>    // `std::getenv`, `std::atol`
#include <functional> // `std::ref`
#include <string>     // `std::string`

#include <benchmark/benchmark.h>
#include <fmt/core.h>

#include "reciprocal.hpp"
#include "reciprocal_dataset.hpp"

namespace bm = benchmark;
using namespace reciprocal;

/**
 *  @brief  Runs the main loop of the benchmark, reporting the bandwidth and the relative @b error
 *          against the serial sum of the same dataset.
 */
template <typename reducer_, typename... reducer_args_>
void run(bm::State &state, dataset_t const &dataset, reducer_args_ const &...args) {

    std::size_t const n = dataset.size();
    double const sum_expected = dataset.expected_sum;
    double sum = 0;

    reducer_ reducer(dataset.begin(), dataset.end(), args...);
    for (auto _ : state) bm::DoNotOptimize(sum = reducer());

    // Only log stats from the main thread
    if (state.thread_index() != 0) return;
    auto error = std::abs(sum_expected - sum) / sum_expected;
    auto total_ops = state.iterations() * n;
    state.counters["bytes/s"] = bm::Counter(total_ops * sizeof(double), bm::Counter::kIsRate);
    state.counters["error,%"] = bm::Counter(error * 100);
    state.SetComplexityN(n);
}

template <typename reducer_, typename... reducer_args_>
auto register_(std::string const &name, reducer_ &&, dataset_t const &data, reducer_args_... args) {
    using reducer = std::decay_t<reducer_>;
    return bm::RegisterBenchmark(name.c_str(), [&data, args...](bm::State &s) { run<reducer>(s, data, args...); })
        ->MinTime(10)
        ->UseRealTime();
}

/**
 *  @brief Reads a positive integer from the environment.
 *  @return The parsed value, @p fallback if the variable is unset, or zero if it's malformed.
 */
std::size_t env_size(char const *name, std::size_t fallback) {
    char const *value = std::getenv(name);
    if (!value) return fallback;
    long const parsed = std::atol(value);
    return parsed > 0 ? static_cast<std::size_t>(parsed) : 0;
}

int main(int argc, char **argv) {

    // Parse configuration parameters.
    std::size_t const default_elements = 1024ull * 1024ull * 1024ull / sizeof(double);
    if (!std::getenv("RECIPROCAL_LENGTH"))
        fmt::print("You did not feed the size of arrays, so we will use a 1GB array!\n");

    std::size_t const elements = env_size("RECIPROCAL_LENGTH", default_elements);
    std::size_t const threshold = env_size("RECIPROCAL_THRESHOLD", default_threshold_k);
    std::size_t const tasks = env_size("RECIPROCAL_TASKS", total_cores());
    if (elements == 0) {
        fmt::print("Inappropriate `RECIPROCAL_LENGTH` value!\n");
        return 1;
    }
    if (threshold == 0) {
        fmt::print("Inappropriate `RECIPROCAL_THRESHOLD` value!\n");
        return 1;
    }
    if (tasks == 0) {
        fmt::print("Inappropriate `RECIPROCAL_TASKS` value!\n");
        return 1;
    }

    std::size_t const seed = env_size("RECIPROCAL_SEED", 42);
    dataset_t const dataset = make_dataset(elements, seed);
    fmt::print("Dataset size: {} elements, seed {}\n", dataset.size(), dataset.seed);
    fmt::print("Serial reciprocal sum: {:.17g}\n", dataset.expected_sum);

    tf::Executor executor {static_cast<unsigned>(total_cores())};
    fmt::print("Worker threads: {}\n", executor.num_workers());
    fmt::print("Fork/join threshold: {} elements\n", threshold);
    fmt::print("Fan-out tasks: {}\n", tasks);

    // The serial baseline is what the speedups are measured against
    register_("serial/f64", serial_t {}, dataset);

    register_("forkjoin/taskflow", taskflow_forkjoin_t {}, dataset, std::ref(executor), threshold);
    register_("fanout/taskflow", taskflow_fanout_t {}, dataset, std::ref(executor), tasks);
    register_("fanout/fork_union", fork_union_fanout_t {}, dataset, tasks);

#if defined(_OPENMP)
    register_("forkjoin/openmp", openmp_forkjoin_t {}, dataset, threshold);
#endif // defined(_OPENMP)

    bm::Initialize(&argc, argv);
    if (bm::ReportUnrecognizedArguments(argc, argv)) return 1;

    bm::RunSpecifiedBenchmarks();
    bm::Shutdown();
    return 0;
}
