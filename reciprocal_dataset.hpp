/**
 *  @brief Reproducible input arrays for reciprocal sums
 *  @file reciprocal_dataset.hpp
 *  @date 19/10/2026
 */
#pragma once
#include <cstdint> // `std::uint64_t`
#include <random>  // `std::mt19937_64`
#include <vector>  // `std::vector`

#include "reciprocal_serial.hpp"

namespace reciprocal {

/**
 *  @brief Array of values drawn uniformly from `[1, 2)`, together with its serial reciprocal sum.
 *
 *  Every reciprocal lands in `(0.5, 1]`, so no entry is zero and the sum is well-conditioned.
 *  Unlike an array of ones, it exercises the division and keeps partial sums inexact.
 */
struct dataset_t {
    std::vector<double> values;
    double expected_sum = 0;
    std::uint64_t seed = 0;

    double const *begin() const noexcept { return values.data(); }
    double const *end() const noexcept { return values.data() + values.size(); }
    std::size_t size() const noexcept { return values.size(); }
};

/**
 *  @brief Generates @p length values from @p seed. The same seed always yields the same array.
 *  @throws std::bad_alloc if the array doesn't fit in memory.
 */
inline dataset_t make_dataset(std::size_t length, std::uint64_t seed = 42) {
    dataset_t dataset;
    dataset.seed = seed;
    dataset.values.resize(length);

    std::mt19937_64 generator(seed);
    std::uniform_real_distribution<double> distribution(1.0, 2.0);
    for (auto &value : dataset.values) value = distribution(generator);

    dataset.expected_sum = serial_t {dataset.begin(), dataset.end()}();
    return dataset;
}

} // namespace reciprocal
