#pragma once

// ==============================================================================
// Report JSON - Persisted Report Layout
// ==============================================================================
// Reads and writes the report document consumed by storage and telemetry:
//
//   app, version, timestamp_utc, fs_hz, reference_file, cinema_file,
//   beeps {reference, cinema} {count, markers_s, segments[]},
//   summary {...}, channels [{index, ...summary fields}], channels_detected
//
// Level metrics are rounded to 3 decimals, times to 6 decimals.
// ==============================================================================

#include <parity/dsp/systems/report.h>

#include <string>
#include <string_view>

namespace Parity::App {

/// Decimal places of persisted level values
inline constexpr int kLevelDecimals = 3;

/// Decimal places of persisted times
inline constexpr int kTimeDecimals = 6;

/// Round half away from zero, never producing -0
[[nodiscard]] double roundTo(double value, int decimals) noexcept;

/// Serialize a report (2-space indentation, trailing newline)
[[nodiscard]] std::string serializeReport(const DSP::Report& report);

/// Parse a serialized report
/// @param error Set to a description on failure; syntax errors read
///              "invalid JSON: <ArduinoJson error code>"
/// @return false if the text is not valid JSON or lacks required fields;
///         out is left untouched in that case
bool parseReport(std::string_view json, DSP::Report& out, std::string& error);

} // namespace Parity::App
