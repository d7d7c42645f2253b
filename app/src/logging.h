#pragma once

// ==============================================================================
// Logging - Shared Application Logger
// ==============================================================================
// The application layer logs through one named spdlog logger ("parity")
// with a colour stdout sink, created on first use. DSP headers never log.
// ==============================================================================

#include <spdlog/spdlog.h>

#include <memory>

namespace Parity::App {

inline constexpr const char* kLoggerName = "parity";

/// Logger used by the runner; registered with spdlog on first call
std::shared_ptr<spdlog::logger> logger();

} // namespace Parity::App
