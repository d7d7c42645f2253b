// ==============================================================================
// Layer 2: DSP Processor - Signal Conditioner
// ==============================================================================
// Prepares raw loader/capture output for analysis:
//   - downmix interleaved multi-channel frames to mono (channel average)
//   - peak normalization, attenuating only (quiet signals are never boosted)
//   - sample-rate conversion by linear interpolation on a normalized time axis
//
// The rate converter is deliberately cheap and not band-limited; aliasing
// above the lower Nyquist is accepted.
//
// Dependencies:
//   - Layer 0: db_utils.h (kNormalizeEpsilon), interpolation.h
//   - Layer 1: audio_buffer.h
// ==============================================================================

#pragma once

#include <parity/dsp/core/db_utils.h>
#include <parity/dsp/core/interpolation.h>
#include <parity/dsp/primitives/audio_buffer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Parity {
namespace DSP {
namespace SignalConditioner {

// -----------------------------------------------------------------------------
// Mono Reduction
// -----------------------------------------------------------------------------

/// @brief Average interleaved frames to mono
/// @param interleaved numFrames * numChannels samples, frame-major
/// @param numSamples Total sample count (a trailing partial frame is dropped)
/// @param numChannels Channels per frame (0 treated as 1)
[[nodiscard]] inline std::vector<float> downmixToMono(
    const float* interleaved,
    size_t numSamples,
    size_t numChannels
) {
    if (interleaved == nullptr || numSamples == 0) {
        return {};
    }
    if (numChannels <= 1) {
        return std::vector<float>(interleaved, interleaved + numSamples);
    }

    const size_t numFrames = numSamples / numChannels;
    std::vector<float> mono(numFrames, 0.0f);
    const double scale = 1.0 / static_cast<double>(numChannels);

    for (size_t frame = 0; frame < numFrames; ++frame) {
        double sum = 0.0;
        const float* f = interleaved + frame * numChannels;
        for (size_t ch = 0; ch < numChannels; ++ch) {
            sum += static_cast<double>(f[ch]);
        }
        mono[frame] = static_cast<float>(sum * scale);
    }
    return mono;
}

// -----------------------------------------------------------------------------
// Peak Normalization
// -----------------------------------------------------------------------------

/// @brief Largest absolute sample value, 0 for an empty buffer
[[nodiscard]] inline float peakAbsolute(const float* samples, size_t n) noexcept {
    if (samples == nullptr) return 0.0f;

    float peak = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        peak = std::max(peak, std::abs(samples[i]));
    }
    return peak;
}

/// @brief Scale by 1/(peak + kNormalizeEpsilon) if and only if peak > 1.0
/// @note Empty buffers are returned unchanged
[[nodiscard]] inline AudioBuffer normalize(const AudioBuffer& buffer) {
    AudioBuffer out = buffer;
    const float peak = peakAbsolute(out.data(), out.size());

    if (peak > 1.0f) {
        const double scale = 1.0 / (static_cast<double>(peak) + kNormalizeEpsilon);
        for (auto& s : out.samples) {
            s = static_cast<float>(static_cast<double>(s) * scale);
        }
    }
    return out;
}

/// @brief Downmix interleaved input, then normalize
[[nodiscard]] inline AudioBuffer normalize(
    const float* interleaved,
    size_t numSamples,
    size_t numChannels,
    double sampleRate
) {
    AudioBuffer mono;
    mono.sampleRate = sampleRate;
    mono.samples = downmixToMono(interleaved, numSamples, numChannels);
    return normalize(mono);
}

// -----------------------------------------------------------------------------
// Rate Conversion
// -----------------------------------------------------------------------------

/// @brief Number of output samples after converting n samples fsSrc → fsDst
[[nodiscard]] inline size_t resampledLength(size_t n, double fsSrc, double fsDst) noexcept {
    if (n == 0 || fsSrc <= 0.0 || fsDst <= 0.0) return n;
    return static_cast<size_t>(std::llround(static_cast<double>(n) * fsDst / fsSrc));
}

/// @brief Linear-interpolation rate conversion
///
/// Both signals are placed on a [0, 1] time axis (first sample at 0, last at
/// 1) and the source is evaluated at each destination position. Positions are
/// computed in double precision directly from the sample index, so accuracy
/// does not degrade with buffer length.
///
/// @return buffer unchanged when the rates are equal or invalid
[[nodiscard]] inline AudioBuffer resample(const AudioBuffer& buffer, double fsDst) {
    const double fsSrc = buffer.sampleRate;
    if (buffer.empty() || fsSrc <= 0.0 || fsDst <= 0.0 || fsSrc == fsDst) {
        return buffer;
    }

    const size_t nSrc = buffer.size();
    const size_t nDst = resampledLength(nSrc, fsSrc, fsDst);

    AudioBuffer out;
    out.sampleRate = fsDst;
    out.samples.resize(nDst, 0.0f);
    if (nDst == 0) {
        return out;
    }
    if (nSrc == 1 || nDst == 1) {
        std::fill(out.samples.begin(), out.samples.end(), buffer.samples.front());
        return out;
    }

    // Source samples advanced per destination sample
    const double ratio = static_cast<double>(nSrc - 1) / static_cast<double>(nDst - 1);
    const size_t last = nSrc - 1;
    for (size_t i = 0; i < nDst; ++i) {
        const double pos = static_cast<double>(i) * ratio;
        const auto lo = std::min(static_cast<size_t>(std::floor(pos)), last);
        const size_t hi = std::min(lo + 1, last);
        const double t = pos - static_cast<double>(lo);
        out.samples[i] = static_cast<float>(Interpolation::linearInterpolate(
            static_cast<double>(buffer.samples[lo]), static_cast<double>(buffer.samples[hi]), t));
    }
    out.samples[nDst - 1] = buffer.samples[last];
    return out;
}

/// @brief Explicit-rate overload
[[nodiscard]] inline AudioBuffer resample(const AudioBuffer& buffer, double fsSrc, double fsDst) {
    AudioBuffer tagged = buffer;
    tagged.sampleRate = fsSrc;
    return resample(tagged, fsDst);
}

// -----------------------------------------------------------------------------
// Reference Preparation
// -----------------------------------------------------------------------------

/// @brief Full reference loading path: downmix, normalize, convert to target rate
[[nodiscard]] inline AudioBuffer prepareReference(
    const float* interleaved,
    size_t numSamples,
    size_t numChannels,
    double fsSrc,
    double fsTarget
) {
    return resample(normalize(interleaved, numSamples, numChannels, fsSrc), fsTarget);
}

} // namespace SignalConditioner
} // namespace DSP
} // namespace Parity
