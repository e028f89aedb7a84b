/**
 * @file TestTimeDomain.cpp
 * @brief Unit tests for feature::TimeDomain.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "biosig/feature/TimeDomain.hpp"

#include <cmath>
#include <vector>

namespace biosig::feature {

using Catch::Matchers::WithinAbs;

TEST_CASE("TimeDomain statistics of an alternating signal", "[feature][time]")
{
    const std::vector<double> x{1.0, -1.0, 1.0, -1.0};
    const auto f = TimeDomain::compute(x);

    REQUIRE_THAT(f.mean, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(f.std, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(f.rms, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(f.iemg, WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(f.mav, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(f.wl, WithinAbs(6.0, 1e-12));
    REQUIRE(f.zc == 3.0);
    REQUIRE_THAT(f.median, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(f.iqr, WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(f.skew, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(f.kurtosis, WithinAbs(-2.0, 1e-12));
}

TEST_CASE("TimeDomain statistics of a ramp", "[feature][time]")
{
    const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
    const auto f = TimeDomain::compute(x);

    REQUIRE_THAT(f.mean, WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(f.std, WithinAbs(std::sqrt(2.0), 1e-12));
    REQUIRE_THAT(f.rms, WithinAbs(std::sqrt(11.0), 1e-12));
    REQUIRE_THAT(f.wl, WithinAbs(4.0, 1e-12));
    REQUIRE(f.zc == 0.0);
    REQUIRE_THAT(f.median, WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(f.iqr, WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(f.skew, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(f.kurtosis, WithinAbs(-1.3, 1e-12));
}

TEST_CASE("TimeDomain shape statistics are zero for a constant signal", "[feature][time]")
{
    const std::vector<double> x(32, 2.5);
    const auto f = TimeDomain::compute(x);

    REQUIRE(f.std == 0.0);
    REQUIRE(f.skew == 0.0);
    REQUIRE(f.kurtosis == 0.0);
    REQUIRE_THAT(f.median, WithinAbs(2.5, 1e-12));
    REQUIRE(f.iqr == 0.0);
}

TEST_CASE("TimeDomain skew follows the tail", "[feature][time]")
{
    const std::vector<double> rightTail{0.0, 0.0, 0.0, 0.0, 10.0};
    REQUIRE(TimeDomain::compute(rightTail).skew > 0.0);

    const std::vector<double> leftTail{0.0, 0.0, 0.0, 0.0, -10.0};
    REQUIRE(TimeDomain::compute(leftTail).skew < 0.0);
}

TEST_CASE("Zero crossings ignore samples that touch zero", "[feature][time]")
{
    const std::vector<double> x{1.0, 0.0, -1.0, -2.0, 3.0};
    REQUIRE(TimeDomain::zeroCrossings(x) == 1);
}

TEST_CASE("Percentile interpolates linearly between ranks", "[feature][time]")
{
    const std::vector<double> sorted{10.0, 20.0, 30.0, 40.0};
    REQUIRE_THAT(TimeDomain::percentile(sorted, 0.0), WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(TimeDomain::percentile(sorted, 100.0), WithinAbs(40.0, 1e-12));
    REQUIRE_THAT(TimeDomain::percentile(sorted, 50.0), WithinAbs(25.0, 1e-12));
    REQUIRE(TimeDomain::percentile({}, 50.0) == 0.0);
}

} // namespace biosig::feature
