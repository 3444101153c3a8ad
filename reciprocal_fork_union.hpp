/**
 *  @brief Fixed fan-out reciprocal sums on a `fork_union` thread pool
 *  @file reciprocal_fork_union.hpp
 *  @date 19/10/2026
 */
#pragma once
#include <new>       // `std::hardware_destructive_interference_size`
#include <stdexcept> // `std::runtime_error`, `std::invalid_argument`
#include <vector>    // `std::vector`

#include <fork_union.hpp>

#include "reciprocal_serial.hpp"

namespace reciprocal {

/**
 *  @brief Computes the reciprocal sum with a @b fixed fan-out of `tasks` contiguous ranges,
 *         reusing a fixed-size `fork_union` thread pool.
 *  @see   https://github.com/ashvardanian/fork_union
 *
 *  The calling thread is thread zero of the pool and always takes range zero. Range `i` goes
 *  to thread `i % threads`, so there may be more ranges than threads. Every partial sum lands
 *  in its own slot, and slots are accumulated in range order after the pool is joined, which
 *  makes the result bitwise-identical to `taskflow_fanout_gt` with the same number of tasks.
 */
template <typename serial_at = serial_t>
class fork_union_fanout_gt {
    using pool_t = fork_union::fork_union_t;
    double const *const begin_ = nullptr;
    double const *const end_ = nullptr;
    std::size_t const tasks_ = 1;
    std::size_t const threads_ = 1;
    pool_t pool_;

    /**
     *  Make sure different threads never output to the same cache lines.
     *  Over-aligning with `std::max_align_t` or a fixed size of 128 bytes
     *  should be enough to avoid false sharing.
     */
    struct alignas(std::hardware_destructive_interference_size) task_result_t {
        double partial_sum = 0;
    };
    std::vector<task_result_t> sums_;

  public:
    fork_union_fanout_gt() = default;
    fork_union_fanout_gt(double const *b, double const *e, std::size_t tasks, std::size_t threads = total_cores())
        : begin_(b), end_(e), tasks_(tasks), threads_(threads), sums_() {
        if (tasks_ == 0) throw std::invalid_argument("Fan-out needs at least one task");
        if (threads_ == 0) throw std::invalid_argument("Fan-out needs at least one thread");
        if (!pool_.try_spawn(threads_)) throw std::runtime_error("Failed to fork threads");
        sums_.resize(tasks_);
    }

    std::size_t tasks() const noexcept { return tasks_; }
    std::size_t threads() const noexcept { return threads_; }

    double operator()() {
        auto const input_size = static_cast<std::size_t>(end_ - begin_);
        std::size_t const tasks = tasks_;
        std::size_t const threads = threads_;
        pool_.for_each_thread([&](std::size_t thread_id) noexcept {
            for (std::size_t task = thread_id; task < tasks; task += threads) {
                range_t const range = chunk_range(task, tasks, input_size);
                sums_[task].partial_sum = serial_at {begin_ + range.start, begin_ + range.end}();
            }
        });

        double running_sum = 0;
        for (auto const &sum : sums_) running_sum += sum.partial_sum;
        return running_sum;
    }
};

using fork_union_fanout_t = fork_union_fanout_gt<>;

} // namespace reciprocal
