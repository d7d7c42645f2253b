// ==============================================================================
// Layer 0: Core Utility - Interpolation
// ==============================================================================
// Sample-domain and table-domain linear interpolation.
//
// Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>

namespace Parity {
namespace DSP {
namespace Interpolation {

// =============================================================================
// Linear Interpolation
// =============================================================================

/// @brief Linear interpolation between two samples.
///
/// @param y0 Sample at position 0
/// @param y1 Sample at position 1
/// @param t Fractional position in [0, 1]
/// @return Interpolated value
///
/// @note Returns y0 exactly when t=0
///
/// @formula y = y0 + t * (y1 - y0)
[[nodiscard]] constexpr double linearInterpolate(
    double y0,
    double y1,
    double t
) noexcept {
    return y0 + t * (y1 - y0);
}

// =============================================================================
// Piecewise-Linear Table Lookup
// =============================================================================

/// @brief Evaluate the piecewise-linear function through (xp[i], fp[i]) at x.
///
/// @param xp Ascending sample positions
/// @param fp Values at those positions
/// @param n Number of table points
/// @param x Query position
/// @return Interpolated value; fp[0] left of the table, fp[n-1] right of it
///
/// @note Exact table positions return the stored value unchanged
/// @note Empty table returns 0
[[nodiscard]] inline double interpolateTable(
    const float* xp,
    const float* fp,
    size_t n,
    double x
) noexcept {
    if (xp == nullptr || fp == nullptr || n == 0) return 0.0;
    if (x <= static_cast<double>(xp[0])) return static_cast<double>(fp[0]);
    if (x >= static_cast<double>(xp[n - 1])) return static_cast<double>(fp[n - 1]);

    // First table point strictly greater than x; guaranteed in [1, n-1]
    const float* upper = std::upper_bound(xp, xp + n, static_cast<float>(x));
    size_t hi = static_cast<size_t>(upper - xp);
    hi = std::clamp<size_t>(hi, 1, n - 1);
    const size_t lo = hi - 1;

    const double x0 = static_cast<double>(xp[lo]);
    const double x1 = static_cast<double>(xp[hi]);
    if (x1 <= x0) return static_cast<double>(fp[lo]);

    const double t = (x - x0) / (x1 - x0);
    return linearInterpolate(static_cast<double>(fp[lo]), static_cast<double>(fp[hi]), t);
}

/// @brief Evaluate a table at every query position.
///
/// @param xp Ascending table positions
/// @param fp Table values
/// @param n Number of table points
/// @param x Query positions
/// @param out Destination (m values)
/// @param m Number of query positions
inline void interpolateTable(
    const float* xp,
    const float* fp,
    size_t n,
    const float* x,
    float* out,
    size_t m
) noexcept {
    if (x == nullptr || out == nullptr) return;
    for (size_t i = 0; i < m; ++i) {
        out[i] = static_cast<float>(interpolateTable(xp, fp, n, static_cast<double>(x[i])));
    }
}

} // namespace Interpolation
} // namespace DSP
} // namespace Parity
