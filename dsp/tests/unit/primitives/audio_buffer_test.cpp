// ==============================================================================
// Layer 1: DSP Primitive Tests - Audio Buffer
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <parity/dsp/primitives/audio_buffer.h>

#include <vector>

using namespace Parity::DSP;
using Catch::Approx;

TEST_CASE("AudioBuffer duration", "[audio_buffer]") {
    AudioBuffer buffer;
    REQUIRE(buffer.empty());
    REQUIRE(buffer.durationSeconds() == 0.0);

    buffer.samples.assign(24000, 0.0f);
    REQUIRE(buffer.durationSeconds() == 0.0);

    buffer.sampleRate = 48000.0;
    REQUIRE(buffer.durationSeconds() == Approx(0.5));
}

TEST_CASE("AudioBuffer slice clamps to the buffer", "[audio_buffer]") {
    AudioBuffer buffer;
    buffer.sampleRate = 8000.0;
    buffer.samples = {0.0f, 1.0f, 2.0f, 3.0f, 4.0f};

    SECTION("interior range") {
        const auto s = buffer.slice(1, 3);
        REQUIRE(s.samples == std::vector<float>{1.0f, 2.0f});
        REQUIRE(s.sampleRate == 8000.0);
    }

    SECTION("end past the buffer") {
        REQUIRE(buffer.slice(3, 100).size() == 2);
    }

    SECTION("empty and inverted ranges") {
        REQUIRE(buffer.slice(2, 2).empty());
        REQUIRE(buffer.slice(4, 1).empty());
    }
}
