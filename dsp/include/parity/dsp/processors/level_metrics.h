// ==============================================================================
// Layer 2: DSP Processor - Level Metrics
// ==============================================================================
// Scalar level and spectral measurements:
//
//   rmsDb        20*log10(sqrt(mean(x^2) + eps) + eps)
//   crestDb      20*log10((peak|x| + eps) / (rms + eps))
//   bandEnergyDb mean linear power of the bins inside [f1, f2], in dB
//   relative     current spectrum on the reference grid, minus reference
//   deviation    percentile of |relative| inside an analysis range
//
// eps is kLevelEpsilon. Silent input therefore floors at about -200 dB
// instead of producing -inf or NaN.
//
// Dependencies:
//   - Layer 0: db_utils.h, interpolation.h, statistics.h
//   - Layer 2: welch_estimator.h (SpectralEstimate)
// ==============================================================================

#pragma once

#include <parity/dsp/core/db_utils.h>
#include <parity/dsp/core/interpolation.h>
#include <parity/dsp/core/statistics.h>
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/processors/welch_estimator.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace Parity {
namespace DSP {

/// @brief Difference spectrum on the reference frequency grid
struct RelativeSpectrum {
    std::vector<float> frequencies;
    std::vector<float> deltaDb;   ///< current - reference, per bin

    [[nodiscard]] size_t size() const noexcept { return frequencies.size(); }
};

namespace LevelMetrics {

// -----------------------------------------------------------------------------
// Time-Domain Levels
// -----------------------------------------------------------------------------

/// @brief Linear RMS with the level epsilon inside the square root
[[nodiscard]] inline double rms(const float* samples, size_t n) noexcept {
    double sumSquares = 0.0;
    if (samples != nullptr) {
        for (size_t i = 0; i < n; ++i) {
            const double s = static_cast<double>(samples[i]);
            sumSquares += s * s;
        }
    }
    const double meanSquare = n > 0 ? sumSquares / static_cast<double>(n) : 0.0;
    return std::sqrt(meanSquare + kLevelEpsilon);
}

/// @brief RMS level in dB
[[nodiscard]] inline double rmsDb(const float* samples, size_t n) noexcept {
    return amplitudeToDb(rms(samples, n));
}

[[nodiscard]] inline double rmsDb(const AudioBuffer& buffer) noexcept {
    return rmsDb(buffer.data(), buffer.size());
}

/// @brief Peak-to-RMS ratio in dB
/// @note Non-negative for any finite, non-silent signal
[[nodiscard]] inline double crestDb(const float* samples, size_t n) noexcept {
    double peak = 0.0;
    if (samples != nullptr) {
        for (size_t i = 0; i < n; ++i) {
            peak = std::max(peak, std::abs(static_cast<double>(samples[i])));
        }
    }
    const double level = rms(samples, n);
    return 20.0 * std::log10((peak + kLevelEpsilon) / (level + kLevelEpsilon));
}

[[nodiscard]] inline double crestDb(const AudioBuffer& buffer) noexcept {
    return crestDb(buffer.data(), buffer.size());
}

// -----------------------------------------------------------------------------
// Spectral Levels
// -----------------------------------------------------------------------------

/// @brief Average power of the bins inside [lowHz, highHz] (inclusive)
/// @return Level in dB, or exactly kNoDataDb when no bin falls inside
[[nodiscard]] inline double bandEnergyDb(
    const SpectralEstimate& psd,
    double lowHz,
    double highHz
) noexcept {
    const size_t n = std::min(psd.frequencies.size(), psd.powerDb.size());

    double sum = 0.0;
    size_t count = 0;
    for (size_t k = 0; k < n; ++k) {
        const double f = static_cast<double>(psd.frequencies[k]);
        if (f >= lowHz && f <= highHz) {
            sum += dbToPower(static_cast<double>(psd.powerDb[k]));
            ++count;
        }
    }

    if (count == 0) {
        return static_cast<double>(kNoDataDb);
    }
    return powerToDb(sum / static_cast<double>(count));
}

/// @brief Interpolate current onto the reference grid and subtract the reference
[[nodiscard]] inline RelativeSpectrum relativeSpectrum(
    const SpectralEstimate& reference,
    const SpectralEstimate& current
) {
    RelativeSpectrum out;
    out.frequencies = reference.frequencies;
    out.deltaDb.resize(reference.frequencies.size(), 0.0f);

    const size_t nCur = std::min(current.frequencies.size(), current.powerDb.size());
    for (size_t k = 0; k < out.frequencies.size(); ++k) {
        const double curDb = Interpolation::interpolateTable(
            current.frequencies.data(), current.powerDb.data(), nCur,
            static_cast<double>(reference.frequencies[k]));
        const double refDb = k < reference.powerDb.size()
            ? static_cast<double>(reference.powerDb[k]) : 0.0;
        out.deltaDb[k] = static_cast<float>(curDb - refDb);
    }
    return out;
}

/// @brief Percentile of |delta| over bins inside [lowHz, highHz]
///
/// Falls back to the whole spectrum when no bin lies in range; returns 0 for
/// an empty spectrum.
[[nodiscard]] inline double spectralDeviationDb(
    const RelativeSpectrum& relative,
    double lowHz,
    double highHz,
    double percent
) {
    std::vector<float> inRange;
    std::vector<float> all;
    inRange.reserve(relative.deltaDb.size());
    all.reserve(relative.deltaDb.size());

    const size_t n = std::min(relative.frequencies.size(), relative.deltaDb.size());
    for (size_t k = 0; k < n; ++k) {
        const float magnitude = std::abs(relative.deltaDb[k]);
        all.push_back(magnitude);
        const double f = static_cast<double>(relative.frequencies[k]);
        if (f >= lowHz && f <= highHz) {
            inRange.push_back(magnitude);
        }
    }

    return Statistics::percentile(inRange.empty() ? std::move(all) : std::move(inRange), percent);
}

} // namespace LevelMetrics
} // namespace DSP
} // namespace Parity
