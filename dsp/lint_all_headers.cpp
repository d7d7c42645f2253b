// ==============================================================================
// Parity DSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy and the compiler a .cpp
// translation unit that includes every public DSP header, so each header is
// checked to be self-contained.
//
// This file is NOT part of the DSP library itself; it is compiled as a
// separate OBJECT library target (parity_dsp_lint_stub).
// ==============================================================================

// Layer 0: Core
#include <parity/dsp/core/analysis_config.h>
#include <parity/dsp/core/db_utils.h>
#include <parity/dsp/core/interpolation.h>
#include <parity/dsp/core/math_constants.h>
#include <parity/dsp/core/statistics.h>
#include <parity/dsp/core/window_functions.h>

// Layer 1: Primitives
#include <parity/dsp/primitives/audio_buffer.h>
#include <parity/dsp/primitives/fft.h>
#include <parity/dsp/primitives/rc_highpass.h>

// Layer 2: Processors
#include <parity/dsp/processors/level_metrics.h>
#include <parity/dsp/processors/marker_detector.h>
#include <parity/dsp/processors/segment_builder.h>
#include <parity/dsp/processors/signal_conditioner.h>
#include <parity/dsp/processors/welch_estimator.h>

// Layer 3: Systems
#include <parity/dsp/systems/comparison_engine.h>
#include <parity/dsp/systems/metric_extractor.h>
#include <parity/dsp/systems/report.h>
#include <parity/dsp/systems/verdict_engine.h>
