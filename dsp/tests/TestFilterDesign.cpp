/**
 * @file TestFilterDesign.cpp
 * @brief Unit tests for Butterworth and notch design.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "biosig/dsp/FilterDesign.hpp"

#include <cmath>

namespace biosig::dsp {

using Catch::Matchers::WithinAbs;

TEST_CASE("Second-order lowpass at half Nyquist matches the analytic design", "[dsp][design]")
{
    const auto sos = designButterworth(2, FilterBand::kLowpass, 0.5);
    REQUIRE(sos.has_value());
    REQUIRE(sos->size() == 1);

    const auto &[b, a] = sos->front();
    REQUIRE_THAT(b[0], WithinAbs(0.29289321881345, 1e-10));
    REQUIRE_THAT(b[1], WithinAbs(0.58578643762690, 1e-10));
    REQUIRE_THAT(b[2], WithinAbs(0.29289321881345, 1e-10));
    REQUIRE_THAT(a[0], WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(a[1], WithinAbs(0.0, 1e-10));
    REQUIRE_THAT(a[2], WithinAbs(0.17157287525381, 1e-10));
}

TEST_CASE("First-order lowpass is a single first-order section", "[dsp][design]")
{
    const auto sos = designButterworth(1, FilterBand::kLowpass, 0.5);
    REQUIRE(sos.has_value());
    REQUIRE(sos->size() == 1);

    const auto &[b, a] = sos->front();
    REQUIRE_THAT(b[0], WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(b[1], WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(b[2], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(a[1], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(a[2], WithinAbs(0.0, 1e-12));
}

TEST_CASE("Butterworth magnitude is -3 dB at the cutoff", "[dsp][design]")
{
    const double halfPower = 1.0 / std::sqrt(2.0);

    SECTION("lowpass")
    {
        const auto sos = designButterworth(4, FilterBand::kLowpass, 0.2);
        REQUIRE(sos.has_value());
        REQUIRE(sos->size() == 2);
        REQUIRE_THAT(magnitudeResponse(*sos, 0.0), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(magnitudeResponse(*sos, 0.2), WithinAbs(halfPower, 1e-9));
        REQUIRE(magnitudeResponse(*sos, 0.8) < 1e-3);
    }

    SECTION("highpass")
    {
        const auto sos = designButterworth(3, FilterBand::kHighpass, 0.1);
        REQUIRE(sos.has_value());
        REQUIRE(sos->size() == 2);
        REQUIRE_THAT(magnitudeResponse(*sos, 0.1), WithinAbs(halfPower, 1e-9));
        REQUIRE(magnitudeResponse(*sos, 0.0) < 1e-9);
        REQUIRE_THAT(magnitudeResponse(*sos, 1.0), WithinAbs(1.0, 1e-9));
    }

    SECTION("bandpass")
    {
        const auto sos = designButterworth(4, FilterBand::kBandpass, 0.002, 0.2);
        REQUIRE(sos.has_value());
        REQUIRE(sos->size() == 4);
        REQUIRE_THAT(magnitudeResponse(*sos, 0.002), WithinAbs(halfPower, 1e-6));
        REQUIRE_THAT(magnitudeResponse(*sos, 0.2), WithinAbs(halfPower, 1e-6));
        REQUIRE_THAT(magnitudeResponse(*sos, 0.02), WithinAbs(1.0, 1e-3));
        REQUIRE(magnitudeResponse(*sos, 0.0) < 1e-9);
    }
}

TEST_CASE("Notch removes its centre frequency and passes DC", "[dsp][design]")
{
    const auto sos = designNotch(0.1, 30.0);
    REQUIRE(sos.has_value());
    REQUIRE(sos->size() == 1);
    REQUIRE(magnitudeResponse(*sos, 0.1) < 1e-9);
    REQUIRE_THAT(magnitudeResponse(*sos, 0.0), WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(magnitudeResponse(*sos, 0.5), WithinAbs(1.0, 1e-2));
}

TEST_CASE("Invalid designs are configuration errors", "[dsp][design]")
{
    REQUIRE(designButterworth(0, FilterBand::kLowpass, 0.2).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(designButterworth(4, FilterBand::kLowpass, 1.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(designButterworth(4, FilterBand::kHighpass, 0.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(designButterworth(4, FilterBand::kBandpass, 0.3, 0.2).error().code
            == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(designNotch(1.2, 30.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(designNotch(0.1, 0.0).error().code == core::ErrorCode::kInvalidConfiguration);
}

} // namespace biosig::dsp
