// ==============================================================================
// Layer 3: System Tests - Comparison Engine
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <parity/dsp/systems/comparison_engine.h>

#include "test_helpers/test_signals.h"

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using namespace Parity::DSP;
using namespace TestHelpers;
using Catch::Approx;

namespace {

AudioBuffer beepBuffer(const BeepTrackSpec& spec = {}) {
    return makeBuffer(makeBeepTrack(spec), spec.sampleRate);
}

/// Tones in every default band; mfGain scales the two mid-band partials
AudioBuffer programBuffer(double mfGain = 1.0) {
    return makeBuffer(makeMultiSine(96000, {
        {60.0, 0.1},
        {500.0, 0.1 * mfGain},
        {1000.0, 0.1 * mfGain},
        {4000.0, 0.1},
    }, 48000.0));
}

} // namespace

// ==============================================================================
// Input Validation
// ==============================================================================

TEST_CASE("Mismatched or empty inputs are rejected", "[comparison][validation]") {
    const ComparisonEngine engine;
    const AudioBuffer good = beepBuffer();

    SECTION("sample rate mismatch") {
        const AudioBuffer other = makeBuffer(good.samples, 44100.0);
        const auto result = engine.compare(good, other);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.status == ComparisonStatus::InputError);
    }

    SECTION("empty reference") {
        REQUIRE_FALSE(engine.compare(AudioBuffer{}, good).ok());
    }

    SECTION("empty current") {
        REQUIRE_FALSE(engine.compare(good, makeBuffer({})).ok());
    }

    SECTION("invalid configuration") {
        AnalysisConfig config;
        config.spectral.overlapRatio = 1.0;
        REQUIRE_FALSE(compare(good, good, config).ok());
    }
}

// ==============================================================================
// Full Pipeline
// ==============================================================================

TEST_CASE("Identical beep tracks pass with one channel per marker pair", "[comparison][pipeline]") {
    const AudioBuffer track = beepBuffer();
    const ComparisonResult result = ComparisonEngine().compare(track, track);

    REQUIRE(result.ok());
    REQUIRE(toString(result.status) == "ok");
    REQUIRE(result.verdict.passed());
    REQUIRE(result.metrics.diffRmsDb == 0.0);
    REQUIRE(result.metrics.specDev95Db == 0.0);

    REQUIRE(result.referenceMarkers.size() == 4);
    REQUIRE(result.currentMarkers == result.referenceMarkers);
    REQUIRE(result.referenceSegments.size() == 3);
    REQUIRE(result.currentSegments.size() == 3);

    REQUIRE(result.channels.size() == 3);
    for (size_t i = 0; i < result.channels.size(); ++i) {
        REQUIRE(result.channels[i].index == i + 1);
        REQUIRE(result.channels[i].verdict.passed());
    }

    REQUIRE(result.diagnostics.refPsd.isWellFormed());
}

TEST_CASE("Quiet capture fails as a dead channel", "[comparison][pipeline]") {
    const AudioBuffer reference = beepBuffer();
    auto quiet = reference.samples;
    applyGain(quiet, dbToGain(-30.0));

    const ComparisonResult result = ComparisonEngine().compare(reference, makeBuffer(quiet));

    REQUIRE(result.ok());
    REQUIRE_FALSE(result.verdict.passed());
    REQUIRE(result.verdict.has(FailurePredicate::DeadChannel));
    REQUIRE(result.verdict.has(FailurePredicate::LevelDrop));
    REQUIRE(result.verdict.has(FailurePredicate::BandDeviation));
    REQUIRE(result.metrics.diffRmsDb == Approx(-30.0).margin(0.01));

    // Relative thresholds make the markers gain independent
    REQUIRE(result.currentMarkers == result.referenceMarkers);
    REQUIRE(result.channels.size() == 3);
    for (const auto& channel : result.channels) {
        REQUIRE(channel.verdict.has(FailurePredicate::DeadChannel));
    }
}

TEST_CASE("Mid-band boost fails on band deviation in MF only", "[comparison][pipeline]") {
    const ComparisonResult result = ComparisonEngine().compare(programBuffer(), programBuffer(dbToGain(8.0)));

    REQUIRE(result.ok());
    REQUIRE(result.verdict.outcome == Outcome::Failed);
    REQUIRE(result.verdict.has(FailurePredicate::BandDeviation));
    REQUIRE(result.verdict.failedBands == std::vector<std::string>{"MF"});
    REQUIRE_FALSE(result.verdict.has(FailurePredicate::DeadChannel));
    REQUIRE_FALSE(result.verdict.has(FailurePredicate::LevelDrop));
    REQUIRE(result.metrics.findBand("MF")->diffDb == Approx(8.0).margin(0.5));
}

TEST_CASE("All-zero pair gives a finite passing result", "[comparison][edge]") {
    const auto silence = makeBuffer(std::vector<float>(96000, 0.0f));
    const ComparisonResult result = ComparisonEngine().compare(silence, silence);

    REQUIRE(result.ok());
    REQUIRE(result.verdict.passed());
    REQUIRE(result.verdict.predicates.empty());
    REQUIRE(result.verdict.failedBands.empty());

    const MetricResult& m = result.metrics;
    REQUIRE(m.refRmsDb == Approx(-200.0).margin(0.01));
    REQUIRE(m.curRmsDb == Approx(-200.0).margin(0.01));
    REQUIRE(m.diffRmsDb == 0.0);
    REQUIRE(std::isfinite(m.refCrestDb));
    REQUIRE(m.diffCrestDb == 0.0);
    REQUIRE(m.specDev95Db == 0.0);
    REQUIRE_FALSE(m.deadChannel);
    for (const auto& band : m.bands) {
        REQUIRE(std::isfinite(band.refDb));
        REQUIRE(band.diffDb == 0.0);
    }

    REQUIRE(result.referenceMarkers.empty());
    REQUIRE(result.channels.empty());
}

TEST_CASE("Channel count follows the shorter segment list", "[comparison][segments]") {
    BeepTrackSpec shorter;
    shorter.beepStartsSeconds = {0.5, 1.5, 2.5};

    const ComparisonResult result = ComparisonEngine().compare(beepBuffer(), beepBuffer(shorter));

    REQUIRE(result.ok());
    REQUIRE(result.referenceSegments.size() == 3);
    REQUIRE(result.currentSegments.size() == 2);
    REQUIRE(result.channels.size() == 2);
}

TEST_CASE("Segment analysis can be switched off", "[comparison][config]") {
    AnalysisConfig config;
    config.analyzeSegments = false;

    const AudioBuffer track = beepBuffer();
    const ComparisonResult result = compare(track, track, config);

    REQUIRE(result.ok());
    REQUIRE(result.channels.empty());
    REQUIRE(result.referenceSegments.size() == 3);

    const Report report = ReportBuilder::build(
        makeReportInputs(result, track.sampleRate, "reference.wav", "capture"),
        std::chrono::system_clock::time_point{});
    REQUIRE(report.channelsDetected == 3);
    REQUIRE(report.channels.empty());
    REQUIRE(report.reference.count() == 4);
    REQUIRE(report.reference.markersSeconds.front() == Approx(0.55).margin(0.1));
}

TEST_CASE("Signals without beeps still yield global metrics", "[comparison][edge]") {
    const auto noise = makeBuffer(makeGaussianNoise(96000, 0.1));
    const ComparisonResult result = ComparisonEngine().compare(noise, noise);

    REQUIRE(result.ok());
    REQUIRE(result.verdict.passed());
    REQUIRE(result.referenceSegments.empty());
    REQUIRE(result.channels.empty());
}
