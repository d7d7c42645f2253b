// ==============================================================================
// Layer 3: System Component - Verdict Engine
// ==============================================================================
// Fixed-threshold pass/fail decision over a MetricResult. The verdict is
// FAILED if any predicate triggers:
//
//   DeadChannel        metrics.deadChannel
//   BandDeviation      |band diff| > bandToleranceDb for any band
//   CrestDeviation     |crest diff| > crestToleranceDb
//   SpectralDeviation  specDev95 > spectralDeviationLimitDb
//   LevelDrop          rms diff < levelDropLimitDb
//
// Comparisons are strict, so a value exactly at a threshold passes.
// ==============================================================================

#pragma once

#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/systems/metric_extractor.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Parity {
namespace DSP {

enum class Outcome : uint8_t {
    Passed,
    Failed
};

/// @brief Individual failure criteria, in evaluation order
enum class FailurePredicate : uint8_t {
    DeadChannel,
    BandDeviation,
    CrestDeviation,
    SpectralDeviation,
    LevelDrop
};

/// @brief Pass/fail outcome with the predicates that caused it
struct Verdict {
    Outcome outcome = Outcome::Passed;
    std::vector<FailurePredicate> predicates;   ///< Evaluation order, no duplicates
    std::vector<std::string> failedBands;       ///< Band table order

    [[nodiscard]] bool passed() const noexcept { return outcome == Outcome::Passed; }

    [[nodiscard]] bool has(FailurePredicate predicate) const noexcept {
        return std::find(predicates.begin(), predicates.end(), predicate) != predicates.end();
    }
};

[[nodiscard]] constexpr std::string_view toString(Outcome outcome) noexcept {
    return outcome == Outcome::Passed ? "PASSED" : "FAILED";
}

/// @brief Stable snake_case key used in persisted reports
[[nodiscard]] constexpr std::string_view toString(FailurePredicate predicate) noexcept {
    switch (predicate) {
        case FailurePredicate::DeadChannel:       return "dead_channel";
        case FailurePredicate::BandDeviation:     return "band_deviation";
        case FailurePredicate::CrestDeviation:    return "crest_deviation";
        case FailurePredicate::SpectralDeviation: return "spectral_deviation";
        case FailurePredicate::LevelDrop:         return "level_drop";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Outcome> outcomeFromString(std::string_view text) noexcept {
    if (text == "PASSED") return Outcome::Passed;
    if (text == "FAILED") return Outcome::Failed;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<FailurePredicate> predicateFromString(std::string_view text) noexcept {
    for (auto p : {FailurePredicate::DeadChannel, FailurePredicate::BandDeviation,
                   FailurePredicate::CrestDeviation, FailurePredicate::SpectralDeviation,
                   FailurePredicate::LevelDrop}) {
        if (toString(p) == text) return p;
    }
    return std::nullopt;
}

namespace VerdictEngine {

/// @brief Evaluate every predicate against the thresholds
[[nodiscard]] inline Verdict evaluate(const MetricResult& metrics, const VerdictThresholds& thresholds) {
    Verdict verdict;

    if (metrics.deadChannel) {
        verdict.predicates.push_back(FailurePredicate::DeadChannel);
    }

    for (const auto& band : metrics.bands) {
        if (std::abs(band.diffDb) > thresholds.bandToleranceDb) {
            verdict.failedBands.push_back(band.name);
        }
    }
    if (!verdict.failedBands.empty()) {
        verdict.predicates.push_back(FailurePredicate::BandDeviation);
    }

    if (std::abs(metrics.diffCrestDb) > thresholds.crestToleranceDb) {
        verdict.predicates.push_back(FailurePredicate::CrestDeviation);
    }
    if (metrics.specDev95Db > thresholds.spectralDeviationLimitDb) {
        verdict.predicates.push_back(FailurePredicate::SpectralDeviation);
    }
    if (metrics.diffRmsDb < thresholds.levelDropLimitDb) {
        verdict.predicates.push_back(FailurePredicate::LevelDrop);
    }

    verdict.outcome = verdict.predicates.empty() ? Outcome::Passed : Outcome::Failed;
    return verdict;
}

} // namespace VerdictEngine
} // namespace DSP
} // namespace Parity
