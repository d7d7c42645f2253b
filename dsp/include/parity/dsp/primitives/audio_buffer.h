// ==============================================================================
// Layer 1: DSP Primitive - Audio Buffer
// ==============================================================================
// Finite mono sample buffer with its sample rate. Produced by a loader or a
// capture device, conditioned once, then only read.
// ==============================================================================

#pragma once

#include <cstddef>
#include <vector>

namespace Parity {
namespace DSP {

/// @brief Mono audio samples plus sample rate (value type)
struct AudioBuffer {
    std::vector<float> samples;
    double sampleRate = 0.0;

    [[nodiscard]] size_t size() const noexcept { return samples.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples.empty(); }
    [[nodiscard]] const float* data() const noexcept { return samples.data(); }

    /// @brief Length in seconds, 0 when the sample rate is unset
    [[nodiscard]] double durationSeconds() const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }

    /// @brief Copy of samples [start, end), clamped to the buffer
    [[nodiscard]] AudioBuffer slice(size_t start, size_t end) const {
        AudioBuffer out;
        out.sampleRate = sampleRate;
        end = end < samples.size() ? end : samples.size();
        if (start < end) {
            out.samples.assign(samples.begin() + static_cast<std::ptrdiff_t>(start),
                               samples.begin() + static_cast<std::ptrdiff_t>(end));
        }
        return out;
    }
};

} // namespace DSP
} // namespace Parity
