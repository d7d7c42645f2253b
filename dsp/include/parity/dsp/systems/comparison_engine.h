// ==============================================================================
// Layer 3: System Component - Comparison Engine
// ==============================================================================
// Runs the whole analysis for one conditioned reference/current pair:
//
//   metrics + verdict for the full signals
//   markers + segments for each signal
//   optionally metrics + verdict for each matching segment pair
//     (reference segment i against current segment i, i < min(counts))
//
// Both buffers must already share a sample rate (see SignalConditioner).
// A rate mismatch, an empty buffer or an invalid configuration yields
// ComparisonStatus::InputError and an empty result.
//
// Dependencies:
//   - Layer 2: marker_detector.h, segment_builder.h
//   - Layer 3: metric_extractor.h, verdict_engine.h, report.h
// ==============================================================================

#pragma once

#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/processors/marker_detector.h>
#include <parity/dsp/processors/segment_builder.h>
#include <parity/dsp/systems/metric_extractor.h>
#include <parity/dsp/systems/report.h>
#include <parity/dsp/systems/verdict_engine.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Parity {
namespace DSP {

enum class ComparisonStatus : uint8_t {
    Ok,
    InputError
};

[[nodiscard]] constexpr std::string_view toString(ComparisonStatus status) noexcept {
    return status == ComparisonStatus::Ok ? "ok" : "input error";
}

/// @brief Everything one comparison produces
struct ComparisonResult {
    ComparisonStatus status = ComparisonStatus::InputError;

    MetricResult metrics;
    MetricDiagnostics diagnostics;
    Verdict verdict;

    std::vector<size_t> referenceMarkers;
    std::vector<size_t> currentMarkers;
    std::vector<Segment> referenceSegments;
    std::vector<Segment> currentSegments;

    std::vector<ChannelReport> channels;

    [[nodiscard]] bool ok() const noexcept { return status == ComparisonStatus::Ok; }
};

/// @brief Full reference/current comparison
///
/// @par Usage Example
/// @code
/// ComparisonEngine engine(config);
/// ComparisonResult result = engine.compare(reference, current);
/// if (result.ok() && !result.verdict.passed()) { ... }
/// @endcode
class ComparisonEngine {
public:
    ComparisonEngine() = default;
    explicit ComparisonEngine(const AnalysisConfig& config) : config_(config) {}

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }

    /// @brief Compare two mono buffers recorded at the same rate
    [[nodiscard]] ComparisonResult compare(const AudioBuffer& reference, const AudioBuffer& current) const {
        ComparisonResult result;
        if (!inputsValid(reference, current)) {
            return result;
        }

        const MetricExtractor extractor(config_);
        result.metrics = extractor.extract(reference, current, &result.diagnostics);
        result.verdict = VerdictEngine::evaluate(result.metrics, config_.verdict);

        const MarkerDetector detector(config_.markers);
        const double fs = reference.sampleRate;
        result.referenceMarkers = detector.detect(reference);
        result.currentMarkers = detector.detect(current);
        result.referenceSegments = SegmentBuilder::build(result.referenceMarkers, fs, config_.segments);
        result.currentSegments = SegmentBuilder::build(result.currentMarkers, fs, config_.segments);

        if (config_.analyzeSegments) {
            const size_t pairs = std::min(result.referenceSegments.size(), result.currentSegments.size());
            result.channels.reserve(pairs);
            for (size_t i = 0; i < pairs; ++i) {
                const Segment& r = result.referenceSegments[i];
                const Segment& c = result.currentSegments[i];

                ChannelReport channel;
                channel.index = i + 1;
                channel.metrics = extractor.extract(reference.slice(r.start, r.end),
                                                    current.slice(c.start, c.end));
                channel.verdict = VerdictEngine::evaluate(channel.metrics, config_.verdict);
                result.channels.push_back(std::move(channel));
            }
        }

        result.status = ComparisonStatus::Ok;
        return result;
    }

    /// @brief Same-rate, non-empty buffers and a valid configuration
    [[nodiscard]] bool inputsValid(const AudioBuffer& reference, const AudioBuffer& current) const noexcept {
        return config_.isValid()
            && !reference.empty() && !current.empty()
            && reference.sampleRate > 0.0
            && reference.sampleRate == current.sampleRate;
    }

private:
    AnalysisConfig config_;
};

/// @brief One-shot comparison with an explicit configuration
[[nodiscard]] inline ComparisonResult compare(
    const AudioBuffer& reference,
    const AudioBuffer& current,
    const AnalysisConfig& config
) {
    return ComparisonEngine(config).compare(reference, current);
}

/// @brief Report inputs from a successful comparison
[[nodiscard]] inline ReportBuilder::ReportInputs makeReportInputs(
    const ComparisonResult& result,
    double sampleRate,
    const std::string& referenceId,
    const std::string& currentId
) {
    ReportBuilder::ReportInputs inputs;
    inputs.sampleRate = sampleRate;
    inputs.referenceId = referenceId;
    inputs.currentId = currentId;
    inputs.metrics = result.metrics;
    inputs.verdict = result.verdict;
    inputs.referenceMarkers = result.referenceMarkers;
    inputs.currentMarkers = result.currentMarkers;
    inputs.referenceSegments = result.referenceSegments;
    inputs.currentSegments = result.currentSegments;
    inputs.channels = result.channels;
    return inputs;
}

} // namespace DSP
} // namespace Parity
