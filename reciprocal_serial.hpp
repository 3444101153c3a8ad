/**
 *  @brief Serial reciprocal sums and contiguous range partitioning
 *  @file reciprocal_serial.hpp
 *  @date 19/10/2026
 */
#pragma once
#include <algorithm> // `std::min`
#include <cstddef>   // `std::size_t`
#include <stdexcept> // `std::out_of_range`, `std::invalid_argument`
#include <string>    // `std::to_string`
#include <thread>    // `std::thread::hardware_concurrency`
#include <vector>    // `std::vector`

namespace reciprocal {

/**
 *  @brief Default number of elements below which a fork/join task stops splitting
 *         and reduces its range serially.
 */
constexpr std::size_t default_threshold_k = 50000;

/**
 *  @brief Returns the current number of logical cores on the CPU.
 *         On x86 this is the number of threads, not the number of physical cores
 *         due to Simultaneous Multi-Threading @b (SMT) or Hyper-Threading (HT).
 */
inline static std::size_t total_cores() {
    std::size_t const cores = std::thread::hardware_concurrency();
    return cores ? cores : 1;
}

/**
 *  @brief Divides a value by another value and rounds it up to the nearest integer.
 *         Example: `divide_round_up(5, 3) == 2`
 */
inline static std::size_t divide_round_up(std::size_t value, std::size_t multiple) noexcept {
    return ((value + multiple - 1) / multiple);
}

/**
 *  @brief Half-open interval `[start, end)` of array indices.
 *         An empty range has `start == end` and contributes zero to any sum.
 */
struct range_t {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const noexcept { return end - start; }
    bool empty() const noexcept { return start == end; }
};

inline bool operator==(range_t const &a, range_t const &b) noexcept { return a.start == b.start && a.end == b.end; }
inline bool operator!=(range_t const &a, range_t const &b) noexcept { return !(a == b); }

/**
 *  @brief Validates that @p range lies within an array of @p length elements.
 *  @throws std::out_of_range if `start > end` or `end > length`.
 */
inline void check_range(range_t range, std::size_t length) {
    if (range.start > range.end || range.end > length)
        throw std::out_of_range("Invalid range [" + std::to_string(range.start) + ", " + std::to_string(range.end) +
                                ") for an array of " + std::to_string(length) + " elements");
}

#pragma region - Partitioning

/**
 *  @brief Number of elements in every chunk but the last one, when splitting
 *         @p elements into @p chunks contiguous pieces. Rounds up, so the last
 *         chunk may be smaller or even empty.
 *
 *  The number of @p chunks must be positive.
 */
inline std::size_t chunk_size(std::size_t chunks, std::size_t elements) noexcept {
    return divide_round_up(elements, chunks);
}

/**
 *  @brief Inclusive index at which the @p chunk starts.
 *         Clamped to @p elements, so excess chunks start at the end of the array.
 */
inline std::size_t chunk_start(std::size_t chunk, std::size_t chunks, std::size_t elements) noexcept {
    return std::min(chunk * chunk_size(chunks, elements), elements);
}

/**
 *  @brief Exclusive index at which the @p chunk ends.
 *         The last chunk always ends at @p elements.
 */
inline std::size_t chunk_end(std::size_t chunk, std::size_t chunks, std::size_t elements) noexcept {
    return std::min((chunk + 1) * chunk_size(chunks, elements), elements);
}

inline range_t chunk_range(std::size_t chunk, std::size_t chunks, std::size_t elements) noexcept {
    return {chunk_start(chunk, chunks, elements), chunk_end(chunk, chunks, elements)};
}

/**
 *  @brief Splits `[0, elements)` into @p chunks contiguous, ordered, non-overlapping ranges.
 *  @throws std::invalid_argument if @p chunks is zero.
 */
inline std::vector<range_t> partition(std::size_t chunks, std::size_t elements) {
    if (chunks == 0) throw std::invalid_argument("Can't partition into zero chunks");
    std::vector<range_t> ranges(chunks);
    for (std::size_t chunk = 0; chunk != chunks; ++chunk) ranges[chunk] = chunk_range(chunk, chunks, elements);
    return ranges;
}

#pragma endregion - Partitioning

#pragma region - Serial

/**
 *  @brief Computes the sum of reciprocals of a sequence of double values with a plain
 *         @b `for`-loop, accumulating into a single register in ascending index order.
 *
 *  It's the base case of every parallel reducer and the reference they are checked against.
 *  Zero entries are not trapped: they turn into infinities and poison the sum.
 */
class serial_t {
    double const *const begin_ = nullptr;
    double const *const end_ = nullptr;

  public:
    serial_t() = default;
    serial_t(double const *b, double const *e) noexcept : begin_(b), end_(e) {}

    double operator()() const noexcept {
        double sum = 0;
        for (double const *it = begin_; it != end_; ++it) sum += 1.0 / *it;
        return sum;
    }
};

/**
 *  @brief Range-checked serial reciprocal sum over `[range.start, range.end)` of an
 *         array of @p length elements starting at @p begin.
 *  @throws std::out_of_range on invalid ranges.
 */
inline double sequential_sum(double const *begin, std::size_t length, range_t range) {
    check_range(range, length);
    return serial_t {begin + range.start, begin + range.end}();
}

#pragma endregion - Serial

} // namespace reciprocal
