// ==============================================================================
// Layer 1: DSP Primitive - RC High-Pass
// ==============================================================================
// First-order high-pass modelled on an analog RC section:
//
//   y[n] = alpha * (y[n-1] + x[n] - x[n-1])
//   alpha = RC / (RC + dt),  RC = 1 / (2*pi*fc),  dt = 1 / fs
//
// Used ahead of the beep detector so that short calibration tones dominate
// the energy envelope over low-frequency program material.
//
// Dependencies:
//   - Layer 0: math_constants.h (kTwoPiD)
// ==============================================================================

#pragma once

#include <parity/dsp/core/math_constants.h>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace Parity {
namespace DSP {

/// @brief First-order RC high-pass filter.
///
/// @par Usage Example
/// @code
/// RcHighpass hpf;
/// hpf.prepare(48000.0, 1000.0);
/// hpf.processBlock(buffer, numSamples);
/// @endcode
class RcHighpass {
public:
    RcHighpass() noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Configure the filter for processing.
    ///
    /// @param sampleRate Sample rate in Hz
    /// @param cutoffHz Cutoff frequency in Hz (clamped to >= 1 Hz)
    ///
    /// @post filter state cleared, ready for processing
    void prepare(double sampleRate, double cutoffHz = 1000.0) noexcept {
        if (sampleRate <= 0.0) {
            prepared_ = false;
            return;
        }

        const double rc = 1.0 / (kTwoPiD * std::max(1.0, cutoffHz));
        const double dt = 1.0 / sampleRate;
        alpha_ = rc / (rc + dt);

        reset();
        prepared_ = true;
    }

    /// @brief Clear previous input/output state.
    void reset() noexcept {
        x1_ = 0.0;
        y1_ = 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Process a single sample.
    /// @note If prepare() has not succeeded, returns input unchanged
    [[nodiscard]] float process(float x) noexcept {
        if (!prepared_) {
            return x;
        }

        const double xd = static_cast<double>(x);
        const double y = alpha_ * (y1_ + xd - x1_);
        x1_ = xd;
        y1_ = y;
        return static_cast<float>(y);
    }

    /// @brief Process a block of samples in-place.
    void processBlock(float* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) return;
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// @brief Filter a whole signal from a cleared state (allocates).
    [[nodiscard]] std::vector<float> filter(const float* input, size_t numSamples) {
        std::vector<float> out;
        if (input != nullptr) {
            out.assign(input, input + numSamples);
        }
        reset();
        processBlock(out.data(), out.size());
        return out;
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] double alpha() const noexcept { return alpha_; }
    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

private:
    double alpha_ = 1.0;   ///< RC / (RC + dt)
    double x1_ = 0.0;      ///< Previous input sample
    double y1_ = 0.0;      ///< Previous output sample
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Parity
