#pragma once

// ==============================================================================
// ComparisonRunner - One Load / Capture / Compare / Report Cycle
// ==============================================================================
// Drives a single comparison through the external collaborators:
//
//   load config -> read reference -> capture -> condition -> compare
//   -> build report -> serialize -> publish (optional)
//
// Errors from the reader or the capture device abort the run with their
// message kept verbatim in getLastError(). A publish failure does not fail
// the run; it only clears RunOutcome::published.
//
// Thread Safety: not thread-safe; one run at a time.
// ==============================================================================

#include "collaborators.h"

#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/systems/report.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace Parity::App {

enum class RunStatus : uint8_t {
    Ok,
    InputError,     ///< Reference missing/unreadable or rejected by the engine
    CaptureError    ///< Capture device failed
};

[[nodiscard]] std::string_view toString(RunStatus status) noexcept;

/// Result of the most recent run
struct RunOutcome {
    RunStatus status = RunStatus::Ok;
    DSP::Report report;
    std::string json;
    bool publishAttempted = false;
    bool published = false;
    std::string publishError;
};

class ComparisonRunner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// @param sink May be null; publishing is then always skipped
    /// @param clock Source of the report timestamp (system clock by default)
    ComparisonRunner(
        IConfigSupplier& config,
        IAudioFileReader& reader,
        IAudioSource& source,
        IReportSink* sink = nullptr,
        Clock clock = {}
    );

    /// Execute one full cycle
    /// @return false on input or capture error (see getLastError())
    bool runOnce();

    [[nodiscard]] const RunOutcome& lastOutcome() const { return outcome_; }

    /// Get last error message
    std::string getLastError() const { return lastError_; }

    // -------------------------------------------------------------------------
    // Steps (public for tests)
    // -------------------------------------------------------------------------

    /// Read and condition the reference to the run's sample rate
    bool loadReference(const RunConfig& config, DSP::AudioBuffer& out);

    /// Capture and condition the current signal to the run's sample rate
    bool captureCurrent(const RunConfig& config, DSP::AudioBuffer& out);

private:
    bool failRun(RunStatus status, std::string message);
    void publish(const RunConfig& config);

    IConfigSupplier& config_;
    IAudioFileReader& reader_;
    IAudioSource& source_;
    IReportSink* sink_ = nullptr;
    Clock clock_;

    RunOutcome outcome_;
    std::string lastError_;
};

} // namespace Parity::App
