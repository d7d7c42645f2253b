// ==============================================================================
// Layer 0: Core Utility - Statistics
// ==============================================================================
// Order statistics used by the analysis pipeline: median for the marker
// threshold, percentile for spectral deviation.
//
// All functions take their input by value or copy it before sorting; callers'
// arrays are never reordered.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Parity {
namespace DSP {
namespace Statistics {

// -----------------------------------------------------------------------------
// Basic Statistics
// -----------------------------------------------------------------------------

/// @brief Compute arithmetic mean of data
/// @param data Pointer to data array
/// @param n Number of elements
/// @return Mean value, or 0 if n == 0
[[nodiscard]] inline double mean(const float* data, size_t n) noexcept {
    if (data == nullptr || n == 0) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(data[i]);
    }
    return sum / static_cast<double>(n);
}

// -----------------------------------------------------------------------------
// Robust Statistics
// -----------------------------------------------------------------------------

/// @brief Compute percentile with linear interpolation between order statistics
/// @param values Data (copied and sorted internally)
/// @param percent Percentile in [0, 100]
/// @return Value at the requested rank, or 0 for empty input
/// @note rank = percent/100 * (n-1); the result interpolates the two
///       neighbouring sorted values
[[nodiscard]] inline double percentile(std::vector<float> values, double percent) {
    if (values.empty()) {
        return 0.0;
    }

    std::sort(values.begin(), values.end());

    const double clamped = std::clamp(percent, 0.0, 100.0);
    const double rank = clamped / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = rank - static_cast<double>(lo);

    const double a = static_cast<double>(values[lo]);
    const double b = static_cast<double>(values[hi]);
    return a + frac * (b - a);
}

/// @brief Compute median value
/// @param values Data (copied and sorted internally)
/// @return Median, mean of the two middle values for even sizes, 0 if empty
[[nodiscard]] inline double median(std::vector<float> values) {
    if (values.empty()) {
        return 0.0;
    }

    std::sort(values.begin(), values.end());
    const size_t n = values.size();

    if (n % 2 == 0) {
        // Even: average of two middle values
        return (static_cast<double>(values[n / 2 - 1]) + static_cast<double>(values[n / 2])) / 2.0;
    }
    // Odd: middle value
    return static_cast<double>(values[n / 2]);
}

} // namespace Statistics
} // namespace DSP
} // namespace Parity
