// ==============================================================================
// Layer 0: Core Utility - Analysis Configuration
// ==============================================================================
// Immutable configuration value passed into every comparison. Defaults are
// part of the result-compatibility contract with previously generated reports
// and must not be changed casually.
//
// The default band table intentionally lets LFE [30,100] Hz sit inside
// LF [30,120] Hz. Both are evaluated independently by the verdict; whether
// the overlap was meant to be there has never been documented.
// ==============================================================================

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Parity {
namespace DSP {

// =============================================================================
// Band Table
// =============================================================================

/// @brief Named frequency interval, both edges inclusive
struct BandDefinition {
    std::string name;   ///< Report key ("LFE", "MF", ...)
    double lowHz = 0.0;
    double highHz = 0.0;

    [[nodiscard]] bool isValid() const noexcept {
        return !name.empty() && lowHz >= 0.0 && highHz > lowHz;
    }
};

/// @brief Default band table, in report order
[[nodiscard]] inline std::vector<BandDefinition> defaultBands() {
    return {
        {"LFE", 30.0, 100.0},
        {"LF", 30.0, 120.0},
        {"MF", 120.0, 2000.0},
        {"HF", 2000.0, 8000.0},
    };
}

// =============================================================================
// Per-Stage Configuration
// =============================================================================

/// Shortest Welch segment; shorter buffers are zero padded to this length
inline constexpr size_t kMinSegmentLength = 256;

/// Buffers at or below this length yield a flat kNoDataDb spectrum
inline constexpr size_t kDegenerateSignalLength = 16;

/// @brief Welch power spectral density settings
struct SpectralConfig {
    size_t segmentLength = 4096;  ///< Requested samples per segment
    double overlapRatio = 0.5;    ///< Fraction of a segment shared with the next
    bool useHannWindow = true;    ///< false selects a rectangular window

    [[nodiscard]] bool isValid() const noexcept {
        return segmentLength >= kMinSegmentLength && overlapRatio >= 0.0 && overlapRatio < 1.0;
    }
};

/// @brief Level and spectral metric settings
struct MetricConfig {
    double deadChannelMarginDb = 10.0;   ///< Dead if current RMS < reference RMS - margin
    double deviationLowHz = 50.0;        ///< Spectral deviation analysis range
    double deviationHighHz = 8000.0;
    double deviationPercentile = 95.0;

    [[nodiscard]] bool isValid() const noexcept {
        return deadChannelMarginDb >= 0.0 && deviationHighHz > deviationLowHz
            && deviationPercentile >= 0.0 && deviationPercentile <= 100.0;
    }
};

/// @brief Calibration beep detector settings
struct MarkerConfig {
    bool useHighpass = true;             ///< Pre-filter away program content
    double highpassCutoffHz = 1000.0;
    double windowSeconds = 0.02;         ///< Envelope RMS window
    double hopSeconds = 0.01;            ///< Envelope frame advance
    double thresholdOffsetDb = 10.0;     ///< Threshold above envelope median
    double minSeparationSeconds = 0.6;   ///< Minimum gap between retained markers

    [[nodiscard]] bool isValid() const noexcept {
        return highpassCutoffHz > 0.0 && windowSeconds > 0.0 && hopSeconds > 0.0
            && minSeparationSeconds >= 0.0;
    }
};

/// @brief Marker-pair segmentation settings
struct SegmentConfig {
    double guardSeconds = 0.060;      ///< Trimmed after each start marker and before each end marker
    double minLengthSeconds = 0.25;   ///< Shorter segments are discarded

    [[nodiscard]] bool isValid() const noexcept {
        return guardSeconds >= 0.0 && minLengthSeconds >= 0.0;
    }
};

/// @brief Pass/fail tolerances
struct VerdictThresholds {
    double bandToleranceDb = 6.0;           ///< Fail if any |band diff| exceeds this
    double crestToleranceDb = 4.0;          ///< Fail if |crest diff| exceeds this
    double spectralDeviationLimitDb = 12.0; ///< Fail if spec_dev95 exceeds this
    double levelDropLimitDb = -10.0;        ///< Fail if RMS diff falls below this

    [[nodiscard]] bool isValid() const noexcept {
        return bandToleranceDb >= 0.0 && crestToleranceDb >= 0.0 && spectralDeviationLimitDb >= 0.0;
    }
};

// =============================================================================
// AnalysisConfig
// =============================================================================

// IMPORTANT: Field order matters for C++20 designated initializers.
// All designated initializer usage must match this declaration order.
struct AnalysisConfig {
    SpectralConfig spectral;
    MetricConfig metrics;
    MarkerConfig markers;
    SegmentConfig segments;
    VerdictThresholds verdict;
    std::vector<BandDefinition> bands = defaultBands();
    bool analyzeSegments = true;   ///< Also compare each matching segment pair

    [[nodiscard]] bool isValid() const noexcept {
        if (!spectral.isValid() || !metrics.isValid() || !markers.isValid()
            || !segments.isValid() || !verdict.isValid()) {
            return false;
        }
        for (const auto& band : bands) {
            if (!band.isValid()) return false;
        }
        return true;
    }
};

} // namespace DSP
} // namespace Parity
