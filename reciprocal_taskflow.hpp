/**
 *  @brief Fork/join and fixed fan-out reciprocal sums on a Taskflow work-stealing executor
 *  @file reciprocal_taskflow.hpp
 *  @date 19/10/2026
 */
#pragma once
#include <chrono>    // `std::chrono::seconds`
#include <future>    // `std::future`, `std::future_status`
#include <stdexcept> // `std::invalid_argument`
#include <vector>    // `std::vector`

#include <taskflow/taskflow.hpp>

#include "reciprocal_serial.hpp"

namespace reciprocal {

/**
 *  @brief Waits for a child task submitted with `tf::Executor::async` and takes its result.
 *
 *  If the caller is itself a worker of @p executor, parking it on the future could starve
 *  a small pool, so the worker keeps executing other pending tasks until the child is ready.
 *  Any other thread simply blocks on the future.
 */
template <typename result_at>
result_at join(tf::Executor &executor, std::future<result_at> &child) {
    if (executor.this_worker_id() >= 0)
        executor.corun_until([&child] { return child.wait_for(std::chrono::seconds(0)) == std::future_status::ready; });
    return child.get();
}

/**
 *  @brief Computes the reciprocal sum with recursive @b fork/join splitting on a Taskflow executor.
 *
 *  Ranges of at most `threshold` elements are reduced by `serial_at`. Larger ranges are split
 *  at `(start + end) / 2`: the left half is submitted as an asynchronous task, the right half is
 *  reduced by the current task, and only then the left one is joined. So every split creates
 *  exactly one new task and the whole reduction spawns `O(length / threshold)` of them.
 *
 *  The decomposition depends only on the length and the threshold, so the result is
 *  bitwise-identical for any number of workers.
 */
template <typename serial_at = serial_t>
class taskflow_forkjoin_gt {
    double const *const begin_ = nullptr;
    double const *const end_ = nullptr;
    tf::Executor *const executor_ = nullptr;
    std::size_t const threshold_ = default_threshold_k;

  public:
    taskflow_forkjoin_gt() = default;
    taskflow_forkjoin_gt(double const *b, double const *e, tf::Executor &executor,
                         std::size_t threshold = default_threshold_k)
        : begin_(b), end_(e), executor_(&executor), threshold_(threshold) {
        if (threshold_ == 0) throw std::invalid_argument("Fork/join threshold must be positive");
    }

    std::size_t threshold() const noexcept { return threshold_; }

    double operator()() const { return (*this)(range_t {0, static_cast<std::size_t>(end_ - begin_)}); }

    double operator()(range_t range) const {
        check_range(range, static_cast<std::size_t>(end_ - begin_));
        if (executor_->this_worker_id() >= 0) return reduce(range);

        // Outside of the pool, the root task has to be handed over to the workers
        auto root = executor_->async([this, range] { return reduce(range); });
        return root.get();
    }

  private:
    double reduce(range_t range) const {
        if (range.size() <= threshold_) return serial_at {begin_ + range.start, begin_ + range.end}();

        std::size_t const mid = (range.start + range.end) / 2;
        range_t const left_range {range.start, mid};
        range_t const right_range {mid, range.end};

        std::future<double> left = executor_->async([this, left_range] { return reduce(left_range); });
        double const right_sum = reduce(right_range);
        double const left_sum = join(*executor_, left);
        return left_sum + right_sum;
    }
};

/**
 *  @brief Computes the reciprocal sum with a @b fixed fan-out of `tasks` contiguous ranges
 *         on a Taskflow executor.
 *
 *  Ranges `1..tasks-1` are submitted to the executor first, all of them before anything is
 *  awaited. Range `0` is reduced by the calling thread in the meantime. The partial sums are
 *  then joined and accumulated in range order. Ranges are never split further.
 */
template <typename serial_at = serial_t>
class taskflow_fanout_gt {
    double const *const begin_ = nullptr;
    double const *const end_ = nullptr;
    tf::Executor *const executor_ = nullptr;
    std::size_t const tasks_ = 1;

  public:
    taskflow_fanout_gt() = default;
    taskflow_fanout_gt(double const *b, double const *e, tf::Executor &executor, std::size_t tasks)
        : begin_(b), end_(e), executor_(&executor), tasks_(tasks) {
        if (tasks_ == 0) throw std::invalid_argument("Fan-out needs at least one task");
    }

    std::size_t tasks() const noexcept { return tasks_; }

    double operator()() const {
        auto const input_size = static_cast<std::size_t>(end_ - begin_);

        // Start the child tasks
        std::vector<std::future<double>> partials;
        partials.reserve(tasks_ - 1);
        for (std::size_t task = 1; task < tasks_; ++task) {
            range_t const range = chunk_range(task, tasks_, input_size);
            partials.push_back(
                executor_->async([this, range] { return serial_at {begin_ + range.start, begin_ + range.end}(); }));
        }

        // The calling thread takes the first range itself
        range_t const first = chunk_range(0, tasks_, input_size);
        double running_sum = serial_at {begin_ + first.start, begin_ + first.end}();

        for (auto &partial : partials) running_sum += join(*executor_, partial);
        return running_sum;
    }
};

using taskflow_forkjoin_t = taskflow_forkjoin_gt<>;
using taskflow_fanout_t = taskflow_fanout_gt<>;

} // namespace reciprocal
