// ==============================================================================
// Layer 3: System Tests - Metric Extractor
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <parity/dsp/systems/metric_extractor.h>

#include "test_helpers/test_signals.h"

#include <vector>

using namespace Parity::DSP;
using namespace TestHelpers;
using Catch::Approx;

namespace {

constexpr double kFs = 48000.0;
constexpr size_t kLength = 96000;

/// One tone per band region, well away from band edges
std::vector<float> programSignal(double mfGain = 1.0) {
    return makeMultiSine(kLength, {
        {60.0, 0.1},            // LFE and LF
        {500.0, 0.1 * mfGain},  // MF
        {1000.0, 0.1 * mfGain}, // MF
        {4000.0, 0.1},          // HF
    }, kFs);
}

} // namespace

TEST_CASE("Identical signals produce zero differences", "[metric_extractor]") {
    const auto buffer = makeBuffer(programSignal(), kFs);
    const MetricResult m = MetricExtractor().extract(buffer, buffer);

    REQUIRE(m.diffRmsDb == 0.0);
    REQUIRE(m.diffCrestDb == 0.0);
    REQUIRE(m.specDev95Db == 0.0);
    REQUIRE_FALSE(m.deadChannel);

    REQUIRE(m.bands.size() == 4);
    REQUIRE(m.bands[0].name == "LFE");
    REQUIRE(m.bands[1].name == "LF");
    REQUIRE(m.bands[2].name == "MF");
    REQUIRE(m.bands[3].name == "HF");
    for (const auto& band : m.bands) {
        REQUIRE(band.diffDb == 0.0);
        REQUIRE(band.refDb > -90.0);
    }
}

TEST_CASE("Mid-band boost shows up only in the MF band", "[metric_extractor][bands]") {
    const auto reference = makeBuffer(programSignal(), kFs);
    const auto current = makeBuffer(programSignal(dbToGain(8.0)), kFs);

    const MetricResult m = MetricExtractor().extract(reference, current);

    const BandLevel* mf = m.findBand("MF");
    REQUIRE(mf != nullptr);
    REQUIRE(mf->diffDb == Approx(8.0).margin(0.5));
    REQUIRE(m.findBand("LFE")->diffDb == Approx(0.0).margin(0.5));
    REQUIRE(m.findBand("LF")->diffDb == Approx(0.0).margin(0.5));
    REQUIRE(m.findBand("HF")->diffDb == Approx(0.0).margin(0.5));
    REQUIRE(m.diffRmsDb > 0.0);
    REQUIRE_FALSE(m.deadChannel);
}

TEST_CASE("Attenuated current is flagged as a dead channel", "[metric_extractor][dead]") {
    const auto reference = makeBuffer(programSignal(), kFs);
    auto quiet = programSignal();
    applyGain(quiet, dbToGain(-20.0));

    const MetricResult m = MetricExtractor().extract(reference, makeBuffer(quiet, kFs));

    REQUIRE(m.diffRmsDb == Approx(-20.0).margin(0.01));
    REQUIRE(m.curRmsDb == Approx(m.refRmsDb - 20.0).margin(0.01));
    REQUIRE(m.deadChannel);
    for (const auto& band : m.bands) {
        REQUIRE(band.diffDb == Approx(-20.0).margin(0.1));
    }
}

TEST_CASE("Silent current against a real reference", "[metric_extractor][edge]") {
    const auto reference = makeBuffer(programSignal(), kFs);
    const auto silent = makeBuffer(std::vector<float>(kLength, 0.0f), kFs);

    const MetricResult m = MetricExtractor().extract(reference, silent);

    REQUIRE(m.deadChannel);
    REQUIRE(m.curRmsDb == Approx(-200.0).margin(0.01));
    REQUIRE(m.findBand("MF")->curDb == Approx(kPowerFloorDb));
}

TEST_CASE("Diagnostics carry the spectra behind the result", "[metric_extractor][diagnostics]") {
    const auto reference = makeBuffer(programSignal(), kFs);
    const auto current = makeBuffer(programSignal(dbToGain(3.0)), kFs);

    MetricDiagnostics diag;
    const MetricResult m = MetricExtractor().extract(reference, current, &diag);

    REQUIRE(diag.refPsd.isWellFormed());
    REQUIRE(diag.curPsd.isWellFormed());
    REQUIRE(diag.relative.size() == diag.refPsd.size());
    REQUIRE(diag.relative.frequencies == diag.refPsd.frequencies);
    REQUIRE(m.specDev95Db >= 0.0);
}

TEST_CASE("Custom band table and margins are honoured", "[metric_extractor][config]") {
    AnalysisConfig config;
    config.bands = {{"LOW", 20.0, 200.0}, {"HIGH", 3000.0, 5000.0}};
    config.metrics.deadChannelMarginDb = 30.0;

    const auto reference = makeBuffer(programSignal(), kFs);
    auto quiet = programSignal();
    applyGain(quiet, dbToGain(-20.0));

    const MetricResult m = MetricExtractor(config).extract(reference, makeBuffer(quiet, kFs));

    REQUIRE(m.bands.size() == 2);
    REQUIRE(m.bands[0].name == "LOW");
    REQUIRE(m.bands[1].name == "HIGH");
    REQUIRE_FALSE(m.deadChannel);
}
