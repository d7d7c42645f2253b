// ==============================================================================
// Layer 2: DSP Processor - Welch Power Spectral Density Estimator
// ==============================================================================
// Averaged, windowed periodogram in dB (power per Hz).
//
// Segmenting:
//   L    = requested length clamped to [kMinSegmentLength, signal length],
//          then rounded down to a power of two for the radix-2 transform.
//          This departs from a plain clamp whenever the clamped length is
//          not a power of two: a 3000-sample signal is analysed with
//          L = 2048 (one window over samples 0..2047; the tail is not
//          covered) instead of one 3000-sample window, and the bin spacing
//          is fs / 2048.
//   step = L - round(L * overlapRatio)
//   windows start at 0, step, 2*step ... while they fit in the signal; a
//   signal shorter than L yields one zero-padded window
//
// Scaling (one-sided):
//   P[k] = |X[k]|^2 / (fs * sum(w^2)), doubled for 0 < k < L/2
//   The DC and Nyquist bins have no mirror image and are not doubled.
//
// Degenerate input (<= kDegenerateSignalLength samples) returns a flat
// kNoDataDb spectrum on the axis of the configured segment length.
//
// Dependencies:
//   - Layer 0: analysis_config.h, db_utils.h, window_functions.h
//   - Layer 1: fft.h, audio_buffer.h
// ==============================================================================

#pragma once

#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/core/db_utils.h>
#include <parity/dsp/core/window_functions.h>
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/primitives/fft.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Parity {
namespace DSP {

// =============================================================================
// SpectralEstimate
// =============================================================================

/// @brief Power spectrum on an ascending frequency axis (0 .. Nyquist)
struct SpectralEstimate {
    std::vector<float> frequencies;  ///< Bin centre frequencies in Hz
    std::vector<float> powerDb;      ///< Power spectral density in dB

    [[nodiscard]] size_t size() const noexcept { return frequencies.size(); }
    [[nodiscard]] bool empty() const noexcept { return frequencies.empty(); }

    /// @brief Equal lengths and strictly ascending frequency axis
    [[nodiscard]] bool isWellFormed() const noexcept {
        if (frequencies.size() != powerDb.size()) return false;
        for (size_t i = 1; i < frequencies.size(); ++i) {
            if (!(frequencies[i] > frequencies[i - 1])) return false;
        }
        return true;
    }
};

// =============================================================================
// WelchEstimator
// =============================================================================

/// @brief Welch-style spectral estimator
///
/// Holds only configuration; every estimate() call owns its transform and
/// scratch buffers, so one estimator can serve any number of signals.
///
/// @par Usage Example
/// @code
/// WelchEstimator welch;
/// SpectralEstimate psd = welch.estimate(buffer);
/// @endcode
class WelchEstimator {
public:
    WelchEstimator() noexcept = default;
    explicit WelchEstimator(const SpectralConfig& config) noexcept : config_(config) {}

    [[nodiscard]] const SpectralConfig& config() const noexcept { return config_; }

    // -------------------------------------------------------------------------
    // Segment Geometry
    // -------------------------------------------------------------------------

    /// @brief Segment length actually used for a signal of n samples
    ///
    /// min(configured, n) clamped to [kMinSegmentLength, kMaxFFTSize], then
    /// rounded DOWN to a power of two. The result is never larger than the
    /// plain clamp and differs from it for every non power-of-two value
    /// (n = 3000 gives 2048, a configured 3000 gives 2048).
    [[nodiscard]] size_t segmentLengthFor(size_t n) const noexcept {
        size_t length = std::min(config_.segmentLength, n);
        length = std::clamp(length, kMinSegmentLength, kMaxFFTSize);
        return std::bit_floor(length);
    }

    /// @brief Frame advance for a segment of the given length (at least 1)
    [[nodiscard]] size_t stepFor(size_t segmentLength) const noexcept {
        const double ratio = std::clamp(config_.overlapRatio, 0.0, 0.999);
        const auto overlap = static_cast<size_t>(
            std::llround(static_cast<double>(segmentLength) * ratio));
        return std::max<size_t>(1, segmentLength - std::min(overlap, segmentLength - 1));
    }

    /// @brief Number of averaged windows for n samples
    [[nodiscard]] size_t windowCountFor(size_t n) const noexcept {
        const size_t length = segmentLengthFor(n);
        if (n <= length) return 1;
        return 1 + (n - length) / stepFor(length);
    }

    // -------------------------------------------------------------------------
    // Estimation
    // -------------------------------------------------------------------------

    /// @brief Estimate the power spectral density of a mono buffer
    [[nodiscard]] SpectralEstimate estimate(const AudioBuffer& buffer) const {
        return estimate(buffer.data(), buffer.size(), buffer.sampleRate);
    }

    /// @brief Estimate the power spectral density of n samples at sampleRate
    [[nodiscard]] SpectralEstimate estimate(const float* samples, size_t n, double sampleRate) const {
        if (samples == nullptr || n <= kDegenerateSignalLength || sampleRate <= 0.0) {
            return flatSpectrum(sampleRate);
        }

        const size_t length = segmentLengthFor(n);
        const size_t step = stepFor(length);
        const size_t numBins = length / 2 + 1;
        const size_t numWindows = windowCountFor(n);

        PowerSpectrumFFT fft;
        if (!fft.prepare(length)) {
            return flatSpectrum(sampleRate);
        }

        const std::vector<float> window = Window::generate(
            config_.useHannWindow ? WindowType::Hann : WindowType::Rectangular, length);
        const double scale = 1.0 / (sampleRate * Window::sumOfSquares(window.data(), length));

        std::vector<double> accumulated(numBins, 0.0);
        for (size_t w = 0; w < numWindows; ++w) {
            const size_t start = w * step;
            fft.transform(samples + start, std::min(length, n - start), window.data());
            fft.accumulatePower(accumulated.data());
        }

        SpectralEstimate result;
        result.frequencies = frequencyAxis(length, sampleRate);
        result.powerDb.resize(numBins);

        const double average = 1.0 / static_cast<double>(numWindows);
        for (size_t k = 0; k < numBins; ++k) {
            double power = accumulated[k] * average * scale;
            if (k > 0 && k < numBins - 1) {
                power *= 2.0;  // single-sided correction
            }
            result.powerDb[k] = static_cast<float>(powerToDb(power));
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    /// @brief Bin frequencies k * fs / L for k = 0 .. L/2
    [[nodiscard]] static std::vector<float> frequencyAxis(size_t length, double sampleRate) {
        const size_t numBins = length / 2 + 1;
        std::vector<float> axis(numBins, 0.0f);
        const double binWidth = sampleRate / static_cast<double>(length);
        for (size_t k = 0; k < numBins; ++k) {
            axis[k] = static_cast<float>(static_cast<double>(k) * binWidth);
        }
        return axis;
    }

    /// @brief Flat kNoDataDb spectrum over the configured segment length's axis
    [[nodiscard]] SpectralEstimate flatSpectrum(double sampleRate) const {
        const size_t length = std::max(config_.segmentLength, kMinSegmentLength);
        const double fs = sampleRate > 0.0 ? sampleRate : 1.0;

        SpectralEstimate result;
        result.frequencies = frequencyAxis(length, fs);
        result.powerDb.assign(result.frequencies.size(), kNoDataDb);
        return result;
    }

private:
    SpectralConfig config_;
};

} // namespace DSP
} // namespace Parity
