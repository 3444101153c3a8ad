/**
 *  @brief Entry points for serial and parallel reciprocal sums
 *  @file reciprocal.hpp
 *  @date 19/10/2026
 *
 *  All reducers share the same calling convention: they are constructed from a
 *  `[begin, end)` span of doubles plus the parallelism knobs, and reduce it on `operator()`.
 *  The array is never copied or mutated, and must outlive the call.
 */
#pragma once
#include "reciprocal_fork_union.hpp"
#include "reciprocal_openmp.hpp"
#include "reciprocal_serial.hpp"
#include "reciprocal_taskflow.hpp"

namespace reciprocal {

/**
 *  @brief Reciprocal sum of the whole `[begin, end)` span in ascending order.
 */
inline double sequential_sum(double const *begin, double const *end) noexcept { return serial_t {begin, end}(); }

/**
 *  @brief Reciprocal sum of `[begin, end)` with recursive fork/join splitting on @p executor.
 *
 *  Odd lengths are accepted, the left half of an odd range is one element shorter.
 *  @throws std::invalid_argument if @p threshold is zero.
 */
inline double forkjoin_sum(double const *begin, double const *end, tf::Executor &executor,
                           std::size_t threshold = default_threshold_k) {
    return taskflow_forkjoin_t {begin, end, executor, threshold}();
}

/**
 *  @brief Reciprocal sum of `[begin, end)` split into @p tasks ranges, all but the first
 *         one reduced concurrently on @p executor.
 *  @throws std::invalid_argument if @p tasks is zero.
 */
inline double fixed_fanout_sum(double const *begin, double const *end, std::size_t tasks, tf::Executor &executor) {
    return taskflow_fanout_t {begin, end, executor, tasks}();
}

} // namespace reciprocal
