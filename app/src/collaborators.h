#pragma once

// ==============================================================================
// Collaborators - External Interfaces of the Comparison Runner
// ==============================================================================
// Capture devices, file decoding, configuration loading and report transport
// live outside this project. The runner talks to them only through these
// interfaces; tests substitute in-memory fakes.
//
// Failing operations return false and leave a human-readable message in
// getLastError(). The runner forwards that message unchanged.
// ==============================================================================

#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/systems/report.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Parity::App {

// =============================================================================
// Configuration
// =============================================================================

/// Shortest capture the runner will request
inline constexpr double kMinCaptureSeconds = 0.5;

/// Remote telemetry endpoint
struct TelemetrySettings {
    std::string host = "thingsboard.cloud";
    uint16_t port = 1883;
    bool useTls = false;
    std::string token;   ///< Empty disables publishing

    [[nodiscard]] bool enabled() const noexcept { return !token.empty(); }
};

/// Settings for one comparison run
struct RunConfig {
    double sampleRate = 48000.0;
    double captureSeconds = 10.0;   ///< Clamped to kMinCaptureSeconds
    int captureChannels = 1;
    std::string deviceHint;

    std::string referencePath;
    std::string referenceId;        ///< Defaults to referencePath when empty
    std::string captureId = "capture";

    TelemetrySettings telemetry;
    DSP::AnalysisConfig analysis;

    [[nodiscard]] double effectiveCaptureSeconds() const noexcept {
        return captureSeconds < kMinCaptureSeconds ? kMinCaptureSeconds : captureSeconds;
    }

    [[nodiscard]] const std::string& effectiveReferenceId() const noexcept {
        return referenceId.empty() ? referencePath : referenceId;
    }
};

// =============================================================================
// Interfaces
// =============================================================================

/// Records audio from a device
class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    /// Capture interleaved audio
    /// @param out Receives interleaved samples and the device sample rate
    /// @return false on failure (see getLastError())
    virtual bool capture(
        double durationSeconds,
        double sampleRate,
        int channels,
        const std::string& deviceHint,
        DSP::AudioBuffer& out
    ) = 0;

    virtual std::string getLastError() const = 0;
};

/// Decodes an audio file
class IAudioFileReader {
public:
    virtual ~IAudioFileReader() = default;

    /// Read a file as interleaved float samples
    /// @return false if the file is missing or unreadable (see getLastError())
    virtual bool read(
        const std::string& path,
        std::vector<float>& samples,
        int& channels,
        double& sampleRate
    ) = 0;

    virtual std::string getLastError() const = 0;
};

/// Persists or transmits a finished report
class IReportSink {
public:
    virtual ~IReportSink() = default;

    /// One attempt, no retry
    virtual bool publish(const DSP::Report& report, const std::string& json) = 0;

    virtual std::string getLastError() const = 0;
};

/// Supplies the configuration for one run
class IConfigSupplier {
public:
    virtual ~IConfigSupplier() = default;

    virtual RunConfig load() = 0;
};

} // namespace Parity::App
