#include "comparison_runner.h"
#include "logging.h"
#include "report_json.h"

#include <parity/dsp/processors/signal_conditioner.h>
#include <parity/dsp/systems/comparison_engine.h>

#include <utility>
#include <vector>

namespace Parity::App {

std::string_view toString(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Ok:           return "ok";
        case RunStatus::InputError:   return "input error";
        case RunStatus::CaptureError: return "capture error";
    }
    return "unknown";
}

ComparisonRunner::ComparisonRunner(
    IConfigSupplier& config,
    IAudioFileReader& reader,
    IAudioSource& source,
    IReportSink* sink,
    Clock clock
)
    : config_(config)
    , reader_(reader)
    , source_(source)
    , sink_(sink)
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

// =============================================================================
// Run
// =============================================================================

bool ComparisonRunner::runOnce() {
    outcome_ = RunOutcome{};
    lastError_.clear();

    const RunConfig config = config_.load();
    auto log = logger();
    log->info("Starting comparison: reference '{}', {} s at {} Hz",
              config.referencePath, config.effectiveCaptureSeconds(), config.sampleRate);

    DSP::AudioBuffer reference;
    if (!loadReference(config, reference)) {
        return false;
    }

    DSP::AudioBuffer current;
    if (!captureCurrent(config, current)) {
        return false;
    }

    const DSP::ComparisonEngine engine(config.analysis);
    const DSP::ComparisonResult result = engine.compare(reference, current);
    if (!result.ok()) {
        return failRun(RunStatus::InputError,
                       "Comparison rejected input (empty buffer, rate mismatch or invalid configuration)");
    }

    log->debug("Markers: reference {}, current {}; segments: reference {}, current {}",
               result.referenceMarkers.size(), result.currentMarkers.size(),
               result.referenceSegments.size(), result.currentSegments.size());

    outcome_.report = DSP::ReportBuilder::build(
        DSP::makeReportInputs(result, config.sampleRate,
                              config.effectiveReferenceId(), config.captureId),
        clock_());
    outcome_.json = serializeReport(outcome_.report);

    log->info("Verdict: {} (spec_dev95 {:.2f} dB, rms diff {:.2f} dB, {} channel(s))",
              DSP::toString(result.verdict.outcome), result.metrics.specDev95Db,
              result.metrics.diffRmsDb, result.channels.size());
    for (const auto predicate : result.verdict.predicates) {
        log->info("  failed: {}", DSP::toString(predicate));
    }

    publish(config);
    outcome_.status = RunStatus::Ok;
    return true;
}

// =============================================================================
// Steps
// =============================================================================

bool ComparisonRunner::loadReference(const RunConfig& config, DSP::AudioBuffer& out) {
    if (config.referencePath.empty()) {
        return failRun(RunStatus::InputError, "No reference file configured");
    }

    std::vector<float> samples;
    int channels = 0;
    double sampleRate = 0.0;
    if (!reader_.read(config.referencePath, samples, channels, sampleRate)) {
        return failRun(RunStatus::InputError, reader_.getLastError());
    }
    if (samples.empty() || channels <= 0 || sampleRate <= 0.0) {
        return failRun(RunStatus::InputError, "Reference file '" + config.referencePath + "' is empty");
    }

    out = DSP::SignalConditioner::prepareReference(
        samples.data(), samples.size(), static_cast<size_t>(channels), sampleRate, config.sampleRate);
    return true;
}

bool ComparisonRunner::captureCurrent(const RunConfig& config, DSP::AudioBuffer& out) {
    DSP::AudioBuffer captured;
    const int channels = config.captureChannels > 0 ? config.captureChannels : 1;
    if (!source_.capture(config.effectiveCaptureSeconds(), config.sampleRate, channels,
                         config.deviceHint, captured)) {
        return failRun(RunStatus::CaptureError, source_.getLastError());
    }
    if (captured.empty()) {
        return failRun(RunStatus::CaptureError, "Capture returned no samples");
    }

    const double fsCaptured = captured.sampleRate > 0.0 ? captured.sampleRate : config.sampleRate;
    out = DSP::SignalConditioner::resample(
        DSP::SignalConditioner::normalize(captured.data(), captured.size(),
                                          static_cast<size_t>(channels), fsCaptured),
        config.sampleRate);
    return true;
}

// =============================================================================
// Helpers
// =============================================================================

bool ComparisonRunner::failRun(RunStatus status, std::string message) {
    outcome_.status = status;
    lastError_ = std::move(message);
    logger()->error("{}: {}", toString(status), lastError_);
    return false;
}

void ComparisonRunner::publish(const RunConfig& config) {
    auto log = logger();
    if (sink_ == nullptr || !config.telemetry.enabled()) {
        log->warn("Telemetry disabled (no token or sink); report not published");
        return;
    }

    outcome_.publishAttempted = true;
    outcome_.published = sink_->publish(outcome_.report, outcome_.json);
    if (outcome_.published) {
        log->info("Report published to {}:{}", config.telemetry.host, config.telemetry.port);
    } else {
        outcome_.publishError = sink_->getLastError();
        log->warn("Publishing to {}:{} failed: {}", config.telemetry.host,
                  config.telemetry.port, outcome_.publishError);
    }
}

} // namespace Parity::App
