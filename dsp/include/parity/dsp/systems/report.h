// ==============================================================================
// Layer 3: System Component - Comparison Report
// ==============================================================================
// The single immutable record a comparison produces for persistence and
// transport. ReportBuilder::build() assembles it in one call; there is no
// partially populated report.
//
// Times are carried in seconds (markers) and {start, end, duration} triples
// (segments) so consumers never need the sample rate to interpret them.
// ==============================================================================

#pragma once

#include <parity/dsp/processors/segment_builder.h>
#include <parity/dsp/systems/metric_extractor.h>
#include <parity/dsp/systems/verdict_engine.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace Parity {
namespace DSP {

inline constexpr const char* kReportAppName = "Parity";
inline constexpr const char* kReportVersion = "2.0";

/// @brief Segment expressed in seconds
struct SegmentTimes {
    double startS = 0.0;
    double endS = 0.0;
    double durS = 0.0;
};

/// @brief Marker and segment timeline of one signal
struct SignalTimeline {
    std::vector<double> markersSeconds;
    std::vector<SegmentTimes> segments;

    [[nodiscard]] size_t count() const noexcept { return markersSeconds.size(); }
};

/// @brief Metrics and verdict of one matched segment pair (1-based index)
struct ChannelReport {
    size_t index = 0;
    MetricResult metrics;
    Verdict verdict;
};

/// @brief Complete comparison report
struct Report {
    std::string app = kReportAppName;
    std::string version = kReportVersion;
    std::string timestampUtc;        ///< "YYYY-MM-DDTHH:MM:SSZ"
    double sampleRate = 0.0;
    std::string referenceId;
    std::string currentId;

    MetricResult metrics;
    Verdict verdict;

    SignalTimeline reference;
    SignalTimeline current;

    std::vector<ChannelReport> channels;
    size_t channelsDetected = 0;     ///< Matched segment pairs, analysed or not
};

namespace ReportBuilder {

/// @brief ISO-8601 UTC timestamp with whole seconds and a trailing 'Z'
[[nodiscard]] inline std::string formatUtc(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;

    const auto secs = floor<seconds>(time);
    const auto day = floor<days>(secs);
    const year_month_day ymd{day};
    const hh_mm_ss hms{secs - day};

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return buffer;
}

/// @brief Convert sample-index markers and segments to seconds
[[nodiscard]] inline SignalTimeline makeTimeline(
    const std::vector<size_t>& markers,
    const std::vector<Segment>& segments,
    double sampleRate
) {
    SignalTimeline timeline;
    if (sampleRate <= 0.0) {
        return timeline;
    }

    timeline.markersSeconds.reserve(markers.size());
    for (const size_t m : markers) {
        timeline.markersSeconds.push_back(static_cast<double>(m) / sampleRate);
    }

    timeline.segments.reserve(segments.size());
    for (const auto& s : segments) {
        SegmentTimes t;
        t.startS = static_cast<double>(s.start) / sampleRate;
        t.endS = static_cast<double>(s.end) / sampleRate;
        t.durS = s.durationSeconds(sampleRate);
        timeline.segments.push_back(t);
    }
    return timeline;
}

/// @brief Inputs of a report, gathered by the caller
struct ReportInputs {
    double sampleRate = 0.0;
    std::string referenceId;
    std::string currentId;
    MetricResult metrics;
    Verdict verdict;
    std::vector<size_t> referenceMarkers;
    std::vector<size_t> currentMarkers;
    std::vector<Segment> referenceSegments;
    std::vector<Segment> currentSegments;
    std::vector<ChannelReport> channels;
};

/// @brief Assemble a complete report
[[nodiscard]] inline Report build(
    const ReportInputs& inputs,
    std::chrono::system_clock::time_point generatedAt
) {
    Report report;
    report.timestampUtc = formatUtc(generatedAt);
    report.sampleRate = inputs.sampleRate;
    report.referenceId = inputs.referenceId;
    report.currentId = inputs.currentId;
    report.metrics = inputs.metrics;
    report.verdict = inputs.verdict;
    report.reference = makeTimeline(inputs.referenceMarkers, inputs.referenceSegments,
                                    inputs.sampleRate);
    report.current = makeTimeline(inputs.currentMarkers, inputs.currentSegments,
                                  inputs.sampleRate);
    report.channels = inputs.channels;
    report.channelsDetected = std::min(inputs.referenceSegments.size(),
                                       inputs.currentSegments.size());
    return report;
}

} // namespace ReportBuilder
} // namespace DSP
} // namespace Parity
