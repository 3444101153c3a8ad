/**
 *  @brief Fork/join reciprocal sums with OpenMP tasks
 *  @file reciprocal_openmp.hpp
 *  @date 19/10/2026
 */
#pragma once
#include <stdexcept> // `std::invalid_argument`

#if defined(_OPENMP)
#include <omp.h> // `omp_set_dynamic`
#endif

#include "reciprocal_serial.hpp"

namespace reciprocal {

#if defined(_OPENMP)

/**
 *  @brief Computes the reciprocal sum with recursive @b fork/join splitting using OpenMP tasks.
 *  @see   https://www.openmp.org/spec-html/5.0/openmpsu46.html
 *
 *  Follows the same decomposition as `taskflow_forkjoin_gt`: the left half of every split is
 *  deferred as an `omp task`, the right half is reduced in place, then `taskwait` joins them.
 *  Both produce the same tree of partial sums, hence the same bits.
 */
template <typename serial_at = serial_t>
class openmp_forkjoin_gt {
    double const *const begin_ = nullptr;
    double const *const end_ = nullptr;
    std::size_t const threshold_ = default_threshold_k;
    std::size_t const threads_ = 1;

  public:
    openmp_forkjoin_gt() = default;
    openmp_forkjoin_gt(double const *b, double const *e, std::size_t threshold = default_threshold_k,
                       std::size_t threads = total_cores())
        : begin_(b), end_(e), threshold_(threshold), threads_(threads) {
        if (threshold_ == 0) throw std::invalid_argument("Fork/join threshold must be positive");
        if (threads_ == 0) throw std::invalid_argument("OpenMP needs at least one thread");
        omp_set_dynamic(0);
    }

    double operator()() const { return (*this)(range_t {0, static_cast<std::size_t>(end_ - begin_)}); }

    double operator()(range_t range) const {
        check_range(range, static_cast<std::size_t>(end_ - begin_));
        double sum = 0;
#pragma omp parallel num_threads(static_cast<int>(threads_)) default(shared)
#pragma omp single
        sum = reduce(range);
        return sum;
    }

  private:
    double reduce(range_t range) const {
        if (range.size() <= threshold_) return serial_at {begin_ + range.start, begin_ + range.end}();

        std::size_t const mid = (range.start + range.end) / 2;
        range_t const left_range {range.start, mid};
        range_t const right_range {mid, range.end};

        double left_sum = 0;
#pragma omp task default(shared)
        left_sum = reduce(left_range);
        double const right_sum = reduce(right_range);
#pragma omp taskwait
        return left_sum + right_sum;
    }
};

using openmp_forkjoin_t = openmp_forkjoin_gt<>;

#endif // defined(_OPENMP)

} // namespace reciprocal
