// ==============================================================================
// Layer 0: Core Utility Tests - Interpolation
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <parity/dsp/core/interpolation.h>

#include <array>
#include <vector>

using namespace Parity::DSP::Interpolation;
using Catch::Approx;

TEST_CASE("linearInterpolate basic values", "[interpolation][core]") {
    STATIC_REQUIRE(linearInterpolate(0.0, 4.0, 0.25) == 1.0);
    REQUIRE(linearInterpolate(-1.0, 1.0, 0.5) == 0.0);
    REQUIRE(linearInterpolate(10.0, 0.0, 0.5) == 5.0);

    SECTION("t=0 returns y0 exactly") {
        REQUIRE(linearInterpolate(5.0, 10.0, 0.0) == 5.0);
    }
}

TEST_CASE("interpolateTable evaluates a piecewise-linear table", "[interpolation][core]") {
    const std::array<float, 4> xp{0.0f, 1.0f, 2.0f, 4.0f};
    const std::array<float, 4> fp{0.0f, 10.0f, 20.0f, 0.0f};

    SECTION("between points") {
        REQUIRE(interpolateTable(xp.data(), fp.data(), 4, 0.5) == Approx(5.0));
        REQUIRE(interpolateTable(xp.data(), fp.data(), 4, 3.0) == Approx(10.0));
    }

    SECTION("exact table positions return stored values") {
        for (size_t i = 0; i < xp.size(); ++i) {
            REQUIRE(interpolateTable(xp.data(), fp.data(), 4, xp[i]) == static_cast<double>(fp[i]));
        }
    }

    SECTION("queries outside the table clamp to the edge values") {
        REQUIRE(interpolateTable(xp.data(), fp.data(), 4, -3.0) == 0.0);
        REQUIRE(interpolateTable(xp.data(), fp.data(), 4, 100.0) == 0.0);
        REQUIRE(interpolateTable(xp.data(), fp.data(), 3, 100.0) == 20.0);
    }

    SECTION("empty table returns zero") {
        REQUIRE(interpolateTable(xp.data(), fp.data(), 0, 1.0) == 0.0);
    }
}

TEST_CASE("interpolateTable array overload matches scalar lookups", "[interpolation][core]") {
    const std::vector<float> xp{0.0f, 100.0f, 200.0f};
    const std::vector<float> fp{-10.0f, 0.0f, 30.0f};
    const std::vector<float> queries{-50.0f, 50.0f, 150.0f, 250.0f};
    std::vector<float> out(queries.size());

    interpolateTable(xp.data(), fp.data(), xp.size(), queries.data(), out.data(), out.size());

    REQUIRE(out[0] == Approx(-10.0f));
    REQUIRE(out[1] == Approx(-5.0f));
    REQUIRE(out[2] == Approx(15.0f));
    REQUIRE(out[3] == Approx(30.0f));
}
