// ==============================================================================
// Layer 2: DSP Processor - Segment Builder
// ==============================================================================
// Turns consecutive marker pairs into guarded sample ranges:
//
//   a = max(0, m[i] + guard),  b = max(0, m[i+1] - guard)
//
// A range is kept only when b > a and (b - a) / fs >= minLengthSeconds.
// Fewer than two markers produce no segments.
// ==============================================================================

#pragma once

#include <parity/dsp/core/analysis_config.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Parity {
namespace DSP {

/// @brief Half-open sample range [start, end)
struct Segment {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] size_t length() const noexcept { return end > start ? end - start : 0; }

    [[nodiscard]] double durationSeconds(double sampleRate) const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(length()) / sampleRate : 0.0;
    }

    bool operator==(const Segment&) const = default;
};

namespace SegmentBuilder {

/// @brief Guard length in samples for a sample rate
[[nodiscard]] inline size_t guardSamples(const SegmentConfig& config, double sampleRate) noexcept {
    if (sampleRate <= 0.0 || config.guardSeconds <= 0.0) return 0;
    return static_cast<size_t>(std::llround(config.guardSeconds * sampleRate));
}

/// @brief Build segments between consecutive markers
/// @param markers Ascending sample indices
[[nodiscard]] inline std::vector<Segment> build(
    const std::vector<size_t>& markers,
    double sampleRate,
    const SegmentConfig& config
) {
    std::vector<Segment> segments;
    if (markers.size() < 2 || sampleRate <= 0.0) {
        return segments;
    }

    const auto guard = static_cast<int64_t>(guardSamples(config, sampleRate));
    segments.reserve(markers.size() - 1);

    for (size_t i = 0; i + 1 < markers.size(); ++i) {
        const int64_t a = std::max<int64_t>(0, static_cast<int64_t>(markers[i]) + guard);
        const int64_t b = std::max<int64_t>(0, static_cast<int64_t>(markers[i + 1]) - guard);
        if (b <= a) continue;

        const double seconds = static_cast<double>(b - a) / sampleRate;
        if (seconds < config.minLengthSeconds) continue;

        segments.push_back({static_cast<size_t>(a), static_cast<size_t>(b)});
    }
    return segments;
}

} // namespace SegmentBuilder
} // namespace DSP
} // namespace Parity
