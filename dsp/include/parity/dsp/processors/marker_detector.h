// ==============================================================================
// Layer 2: DSP Processor - Calibration Beep Marker Detector
// ==============================================================================
// Locates short calibration tones in a recording:
//
//   1. RC high-pass (default 1 kHz) so tones dominate low-frequency program
//   2. short-time RMS envelope in dB (20 ms window, 10 ms hop)
//   3. threshold = median(envelope) + offset
//   4. each run of frames strictly above threshold yields one marker at its
//      loudest frame (earliest frame on ties), converted to samples as
//      frame * hop
//   5. markers closer than minSeparationSeconds to the previously retained
//      marker are dropped (greedy, left to right)
//
// The median ignores the sparse loud frames the detector looks for, so the
// threshold tracks the background level.
//
// Dependencies:
//   - Layer 0: analysis_config.h (MarkerConfig), db_utils.h, statistics.h
//   - Layer 1: audio_buffer.h, rc_highpass.h
// ==============================================================================

#pragma once

#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/core/db_utils.h>
#include <parity/dsp/core/statistics.h>
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/primitives/rc_highpass.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace Parity {
namespace DSP {

/// @brief Short-time RMS envelope
struct Envelope {
    std::vector<float> levelDb;   ///< One value per frame
    size_t windowSamples = 0;
    size_t hopSamples = 0;

    [[nodiscard]] size_t numFrames() const noexcept { return levelDb.size(); }
};

/// @brief Calibration beep detector
///
/// @par Usage Example
/// @code
/// MarkerDetector detector(config.markers);
/// std::vector<size_t> markers = detector.detect(buffer);
/// @endcode
class MarkerDetector {
public:
    MarkerDetector() noexcept = default;
    explicit MarkerDetector(const MarkerConfig& config) noexcept : config_(config) {}

    [[nodiscard]] const MarkerConfig& config() const noexcept { return config_; }

    // -------------------------------------------------------------------------
    // Stages
    // -------------------------------------------------------------------------

    /// @brief High-pass the signal if enabled, otherwise copy it
    [[nodiscard]] std::vector<float> preFilter(const AudioBuffer& buffer) const {
        if (!config_.useHighpass) {
            return buffer.samples;
        }
        RcHighpass hpf;
        hpf.prepare(buffer.sampleRate, config_.highpassCutoffHz);
        return hpf.filter(buffer.data(), buffer.size());
    }

    /// @brief Short-time RMS envelope in dB
    /// @note frames = 1 + (n - window) / hop; a signal shorter than one window
    ///       yields a single frame over all of it. Empty input yields no frames.
    [[nodiscard]] Envelope computeEnvelope(const float* samples, size_t n, double sampleRate) const {
        Envelope env;
        env.windowSamples = std::max<size_t>(1, static_cast<size_t>(
            std::llround(config_.windowSeconds * sampleRate)));
        env.hopSamples = std::max<size_t>(1, static_cast<size_t>(
            std::llround(config_.hopSeconds * sampleRate)));

        if (samples == nullptr || n == 0) {
            return env;
        }

        const size_t numFrames = n > env.windowSamples
            ? 1 + (n - env.windowSamples) / env.hopSamples
            : 1;
        env.levelDb.resize(numFrames);

        for (size_t frame = 0; frame < numFrames; ++frame) {
            const size_t start = frame * env.hopSamples;
            const size_t end = std::min(n, start + env.windowSamples);

            double sumSquares = 0.0;
            for (size_t i = start; i < end; ++i) {
                const double s = static_cast<double>(samples[i]);
                sumSquares += s * s;
            }
            const double meanSquare = sumSquares / static_cast<double>(end - start);
            env.levelDb[frame] = static_cast<float>(
                amplitudeToDb(std::sqrt(meanSquare + kLevelEpsilon)));
        }
        return env;
    }

    /// @brief Detection threshold for an envelope
    [[nodiscard]] double threshold(const Envelope& env) const {
        return Statistics::median(env.levelDb) + config_.thresholdOffsetDb;
    }

    /// @brief Loudest frame of every above-threshold run, as frame indices
    [[nodiscard]] static std::vector<size_t> peakFrames(const Envelope& env, double threshold) {
        std::vector<size_t> peaks;
        const size_t n = env.numFrames();

        size_t i = 0;
        while (i < n) {
            if (static_cast<double>(env.levelDb[i]) <= threshold) {
                ++i;
                continue;
            }

            size_t best = i;
            size_t j = i;
            while (j < n && static_cast<double>(env.levelDb[j]) > threshold) {
                if (env.levelDb[j] > env.levelDb[best]) {
                    best = j;   // strict: earliest maximum wins ties
                }
                ++j;
            }
            peaks.push_back(best);
            i = j;
        }
        return peaks;
    }

    /// @brief Greedy left-to-right minimum separation filter
    /// @param markers Sample indices (sorted internally)
    [[nodiscard]] std::vector<size_t> enforceSeparation(
        std::vector<size_t> markers,
        double sampleRate
    ) const {
        std::sort(markers.begin(), markers.end());

        std::vector<size_t> kept;
        if (sampleRate <= 0.0) {
            return kept;
        }

        double lastSeconds = -std::numeric_limits<double>::infinity();
        for (const size_t m : markers) {
            const double t = static_cast<double>(m) / sampleRate;
            if (t - lastSeconds >= config_.minSeparationSeconds) {
                // Equal indices can only pass with a zero separation setting
                if (!kept.empty() && m == kept.back()) continue;
                kept.push_back(m);
                lastSeconds = t;
            }
        }
        return kept;
    }

    // -------------------------------------------------------------------------
    // Detection
    // -------------------------------------------------------------------------

    /// @brief Detect beep markers
    /// @return Strictly ascending sample indices; empty if nothing stands out
    [[nodiscard]] std::vector<size_t> detect(const AudioBuffer& buffer) const {
        if (buffer.empty() || buffer.sampleRate <= 0.0) {
            return {};
        }

        const std::vector<float> filtered = preFilter(buffer);
        const Envelope env = computeEnvelope(filtered.data(), filtered.size(), buffer.sampleRate);
        const std::vector<size_t> frames = peakFrames(env, threshold(env));

        std::vector<size_t> markers;
        markers.reserve(frames.size());
        for (const size_t frame : frames) {
            markers.push_back(frame * env.hopSamples);
        }
        return enforceSeparation(std::move(markers), buffer.sampleRate);
    }

private:
    MarkerConfig config_;
};

} // namespace DSP
} // namespace Parity
