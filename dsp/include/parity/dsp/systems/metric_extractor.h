// ==============================================================================
// Layer 3: System Component - Metric Extractor
// ==============================================================================
// Computes the full comparison metric set for one reference/current pair:
// RMS and crest levels, per-band energies, the relative spectrum and its
// percentile deviation, and the dead-channel flag.
//
// The light MetricResult is what reports persist. MetricDiagnostics carries
// the spectra the result was derived from and is only kept when asked for.
//
// Dependencies:
//   - Layer 0: analysis_config.h
//   - Layer 1: audio_buffer.h
//   - Layer 2: welch_estimator.h, level_metrics.h
// ==============================================================================

#pragma once

#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/processors/level_metrics.h>
#include <parity/dsp/processors/welch_estimator.h>

#include <string>
#include <utility>
#include <vector>

namespace Parity {
namespace DSP {

/// @brief Energy of one band in both signals
struct BandLevel {
    std::string name;
    double refDb = 0.0;
    double curDb = 0.0;
    double diffDb = 0.0;   ///< curDb - refDb
};

/// @brief Scalar comparison metrics (persisted)
struct MetricResult {
    double refRmsDb = 0.0;
    double curRmsDb = 0.0;
    double diffRmsDb = 0.0;

    double refCrestDb = 0.0;
    double curCrestDb = 0.0;
    double diffCrestDb = 0.0;

    std::vector<BandLevel> bands;   ///< Band table order
    double specDev95Db = 0.0;
    bool deadChannel = false;

    /// @brief Band entry by name, nullptr if absent
    [[nodiscard]] const BandLevel* findBand(const std::string& name) const noexcept {
        for (const auto& band : bands) {
            if (band.name == name) return &band;
        }
        return nullptr;
    }
};

/// @brief Intermediate spectra behind a MetricResult (never persisted)
struct MetricDiagnostics {
    SpectralEstimate refPsd;
    SpectralEstimate curPsd;
    RelativeSpectrum relative;
};

/// @brief Computes MetricResult for conditioned, equal-rate mono buffers
class MetricExtractor {
public:
    MetricExtractor() = default;

    explicit MetricExtractor(const AnalysisConfig& config)
        : welch_(config.spectral)
        , metrics_(config.metrics)
        , bands_(config.bands) {}

    /// @brief Extract metrics
    /// @param diagnostics Receives the spectra when non-null
    [[nodiscard]] MetricResult extract(
        const AudioBuffer& reference,
        const AudioBuffer& current,
        MetricDiagnostics* diagnostics = nullptr
    ) const {
        MetricResult result;

        result.refRmsDb = LevelMetrics::rmsDb(reference);
        result.curRmsDb = LevelMetrics::rmsDb(current);
        result.diffRmsDb = result.curRmsDb - result.refRmsDb;

        result.refCrestDb = LevelMetrics::crestDb(reference);
        result.curCrestDb = LevelMetrics::crestDb(current);
        result.diffCrestDb = result.curCrestDb - result.refCrestDb;

        SpectralEstimate refPsd = welch_.estimate(reference);
        SpectralEstimate curPsd = welch_.estimate(current);

        result.bands.reserve(bands_.size());
        for (const auto& band : bands_) {
            BandLevel level;
            level.name = band.name;
            level.refDb = LevelMetrics::bandEnergyDb(refPsd, band.lowHz, band.highHz);
            level.curDb = LevelMetrics::bandEnergyDb(curPsd, band.lowHz, band.highHz);
            level.diffDb = level.curDb - level.refDb;
            result.bands.push_back(std::move(level));
        }

        RelativeSpectrum relative = LevelMetrics::relativeSpectrum(refPsd, curPsd);
        result.specDev95Db = LevelMetrics::spectralDeviationDb(
            relative, metrics_.deviationLowHz, metrics_.deviationHighHz,
            metrics_.deviationPercentile);

        result.deadChannel = result.curRmsDb < result.refRmsDb - metrics_.deadChannelMarginDb;

        if (diagnostics != nullptr) {
            diagnostics->refPsd = std::move(refPsd);
            diagnostics->curPsd = std::move(curPsd);
            diagnostics->relative = std::move(relative);
        }
        return result;
    }

private:
    WelchEstimator welch_;
    MetricConfig metrics_;
    std::vector<BandDefinition> bands_ = defaultBands();
};

} // namespace DSP
} // namespace Parity
