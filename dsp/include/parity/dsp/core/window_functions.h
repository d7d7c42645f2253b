// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Window function generators for segment-averaged spectral analysis.
// ==============================================================================

#pragma once

#include <parity/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Parity {
namespace DSP {

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported analysis window types
enum class WindowType : uint8_t {
    Hann,        ///< Hann (periodic) - default for spectral estimation
    Rectangular  ///< Boxcar, all ones
};

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

// -----------------------------------------------------------------------------
// Window Generators (In-Place)
// -----------------------------------------------------------------------------

/// @brief Fill buffer with Hann window (periodic/DFT-even variant)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N) (periodic variant)
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const double N = static_cast<double>(size);
    for (size_t n = 0; n < size; ++n) {
        // Periodic (DFT-even) variant: divides by N, not N-1
        const double phase = kTwoPiD * static_cast<double>(n) / N;
        output[n] = static_cast<float>(0.5 - 0.5 * std::cos(phase));
    }
}

/// @brief Fill buffer with ones
inline void generateRectangular(float* output, size_t size) noexcept {
    if (output == nullptr) return;
    for (size_t n = 0; n < size; ++n) {
        output[n] = 1.0f;
    }
}

// -----------------------------------------------------------------------------
// Window Power
// -----------------------------------------------------------------------------

/// @brief Sum of squared coefficients (the Welch power normalization term)
/// @param window Window coefficients
/// @param size Window size
/// @return sum(w[n]^2), or 0 for an empty window
[[nodiscard]] inline double sumOfSquares(const float* window, size_t size) noexcept {
    if (window == nullptr) return 0.0;

    double sum = 0.0;
    for (size_t n = 0; n < size; ++n) {
        const double w = static_cast<double>(window[n]);
        sum += w * w;
    }
    return sum;
}

// -----------------------------------------------------------------------------
// Factory Function
// -----------------------------------------------------------------------------

/// @brief Generate window coefficients (allocates vector)
/// @param type Window type
/// @param size Window size
/// @return Vector of window coefficients
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size, 0.0f);

    switch (type) {
        case WindowType::Hann:
            generateHann(window.data(), size);
            break;
        case WindowType::Rectangular:
            generateRectangular(window.data(), size);
            break;
    }

    return window;
}

} // namespace Window

} // namespace DSP
} // namespace Parity
