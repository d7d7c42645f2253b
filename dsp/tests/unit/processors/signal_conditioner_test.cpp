// ==============================================================================
// Layer 2: DSP Processor Tests - Signal Conditioner
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <parity/dsp/processors/signal_conditioner.h>

#include "test_helpers/test_signals.h"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace Parity::DSP;
using namespace TestHelpers;
using Catch::Approx;

TEST_CASE("downmixToMono averages interleaved channels", "[conditioner][downmix]") {
    SECTION("stereo") {
        const std::vector<float> stereo{1.0f, -1.0f, 0.5f, 0.5f, 0.2f, 0.0f};
        const auto mono = SignalConditioner::downmixToMono(stereo.data(), stereo.size(), 2);
        REQUIRE(mono.size() == 3);
        REQUIRE(mono[0] == Approx(0.0f).margin(1e-7f));
        REQUIRE(mono[1] == Approx(0.5f));
        REQUIRE(mono[2] == Approx(0.1f));
    }

    SECTION("mono input is copied") {
        const std::vector<float> x{0.1f, 0.2f};
        REQUIRE(SignalConditioner::downmixToMono(x.data(), x.size(), 1) == x);
    }

    SECTION("trailing partial frame is dropped") {
        const std::vector<float> x{1.0f, 1.0f, 1.0f};
        REQUIRE(SignalConditioner::downmixToMono(x.data(), x.size(), 2).size() == 1);
    }

    SECTION("empty input") {
        REQUIRE(SignalConditioner::downmixToMono(nullptr, 0, 2).empty());
    }
}

TEST_CASE("normalize only attenuates", "[conditioner][normalize]") {
    AudioBuffer buffer;
    buffer.sampleRate = 48000.0;

    SECTION("peak above 1 is scaled to just below 1") {
        buffer.samples = {2.0f, -1.0f, 0.5f};
        const auto out = SignalConditioner::normalize(buffer);
        REQUIRE(out.samples[0] == Approx(1.0f));
        REQUIRE(out.samples[1] == Approx(-0.5f));
        REQUIRE(out.samples[2] == Approx(0.25f));
        REQUIRE(SignalConditioner::peakAbsolute(out.data(), out.size()) <= 1.0f);
    }

    SECTION("negative peak counts too") {
        buffer.samples = {0.5f, -4.0f};
        const auto out = SignalConditioner::normalize(buffer);
        REQUIRE(out.samples[1] == Approx(-1.0f));
    }

    SECTION("quiet signal is untouched") {
        buffer.samples = {0.25f, -0.5f};
        const auto out = SignalConditioner::normalize(buffer);
        REQUIRE(out.samples == buffer.samples);
    }

    SECTION("peak of exactly 1 is untouched") {
        buffer.samples = {1.0f, -0.5f};
        REQUIRE(SignalConditioner::normalize(buffer).samples == buffer.samples);
    }

    SECTION("empty stays empty") {
        REQUIRE(SignalConditioner::normalize(buffer).empty());
    }
}

TEST_CASE("resample converts length and preserves endpoints", "[conditioner][resample]") {
    AudioBuffer ramp;
    ramp.sampleRate = 48000.0;
    constexpr size_t kSize = 4801;
    ramp.samples.resize(kSize);
    for (size_t i = 0; i < kSize; ++i) {
        ramp.samples[i] = static_cast<float>(i) / static_cast<float>(kSize - 1);
    }

    SECTION("downsampling") {
        const auto out = SignalConditioner::resample(ramp, 24000.0);
        REQUIRE(out.sampleRate == 24000.0);
        REQUIRE(out.size() == SignalConditioner::resampledLength(kSize, 48000.0, 24000.0));
        REQUIRE(out.size() == 2401);
        REQUIRE(out.samples.front() == Approx(0.0f).margin(1e-6f));
        REQUIRE(out.samples.back() == Approx(1.0f));
    }

    SECTION("a linear ramp stays linear") {
        const auto out = SignalConditioner::resample(ramp, 44100.0);
        const size_t m = out.size();
        for (size_t j = 0; j < m; j += 97) {
            const float expected = static_cast<float>(j) / static_cast<float>(m - 1);
            REQUIRE(out.samples[j] == Approx(expected).margin(1e-4f));
        }
    }

    SECTION("equal rates return the input unchanged") {
        const auto out = SignalConditioner::resample(ramp, 48000.0);
        REQUIRE(out.samples == ramp.samples);
    }

    SECTION("explicit source rate overload") {
        const auto out = SignalConditioner::resample(ramp, 96000.0, 48000.0);
        REQUIRE(out.size() == 2401);
    }
}

TEST_CASE("resample stays exact on multi-minute buffers", "[conditioner][resample][long]") {
    // Three minutes of a 1 kHz tone, 48 kHz to 44.1 kHz
    constexpr double kSrcRate = 48000.0;
    constexpr double kDstRate = 44100.0;
    const size_t nSrc = static_cast<size_t>(180.0 * kSrcRate);
    const AudioBuffer tone = makeBuffer(makeSine(nSrc, 1000.0, kSrcRate, 0.5), kSrcRate);

    const auto out = SignalConditioner::resample(tone, kDstRate);
    const size_t nDst = out.size();
    REQUIRE(nDst == static_cast<size_t>(180.0 * kDstRate));

    // Reference: linear interpolation at positions computed in long double
    const long double ratio = static_cast<long double>(nSrc - 1) / static_cast<long double>(nDst - 1);
    float maxError = 0.0f;
    for (size_t i = 0; i < nDst; i += 7) {
        const long double pos = static_cast<long double>(i) * ratio;
        const auto lo = std::min(static_cast<size_t>(pos), nSrc - 1);
        const size_t hi = std::min(lo + 1, nSrc - 1);
        const long double t = pos - static_cast<long double>(lo);
        const auto expected = static_cast<float>(
            tone.samples[lo] + t * (static_cast<long double>(tone.samples[hi]) - tone.samples[lo]));
        maxError = std::max(maxError, std::abs(out.samples[i] - expected));
    }
    REQUIRE(maxError < 1e-5f);
    REQUIRE(out.samples.back() == tone.samples.back());
}

TEST_CASE("resampledLength rounds to nearest", "[conditioner][resample]") {
    REQUIRE(SignalConditioner::resampledLength(44100, 44100.0, 48000.0) == 48000);
    REQUIRE(SignalConditioner::resampledLength(3, 2.0, 3.0) == 5);   // 4.5 rounds up
    REQUIRE(SignalConditioner::resampledLength(0, 44100.0, 48000.0) == 0);
}

TEST_CASE("prepareReference downmixes, normalizes and converts", "[conditioner]") {
    // Stereo, 0.1 s at 44.1 kHz, left channel clipping at 3.0
    constexpr size_t kFrames = 4410;
    std::vector<float> interleaved(kFrames * 2);
    for (size_t i = 0; i < kFrames; ++i) {
        const float s = static_cast<float>(std::sin(0.05 * static_cast<double>(i)));
        interleaved[2 * i] = 3.0f * s;
        interleaved[2 * i + 1] = s;
    }

    const auto out = SignalConditioner::prepareReference(
        interleaved.data(), interleaved.size(), 2, 44100.0, 48000.0);

    REQUIRE(out.sampleRate == 48000.0);
    REQUIRE(out.size() == 4800);
    REQUIRE(SignalConditioner::peakAbsolute(out.data(), out.size()) <= 1.0f);
    REQUIRE(SignalConditioner::peakAbsolute(out.data(), out.size()) > 0.95f);
}
