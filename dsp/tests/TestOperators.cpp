/**
 * @file TestOperators.cpp
 * @brief Unit tests for the individual preprocessing operators.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "biosig/dsp/ArtifactDetector.hpp"
#include "biosig/dsp/Detrend.hpp"
#include "biosig/dsp/Filters.hpp"
#include "biosig/dsp/Resample.hpp"

#include <cmath>
#include <numbers>

namespace biosig::dsp {

using Catch::Matchers::WithinAbs;

namespace {

SampleFrame makeFrame(Eigen::Index channels, Eigen::Index count, double sampleRate, double start = 0.0)
{
    SampleFrame frame;
    frame.sampleRate = sampleRate;
    frame.samples = SampleMatrix::Zero(channels, count);
    frame.timestamps.resize(static_cast<std::size_t>(count));
    for (Eigen::Index i = 0; i < count; ++i)
        frame.timestamps[static_cast<std::size_t>(i)] = start + static_cast<double>(i) / sampleRate;
    return frame;
}

} // namespace

TEST_CASE("Filters preserve frame shape and timestamps", "[dsp][operator]")
{
    auto frame = makeFrame(3, 400, 1000.0, 12.5);
    for (Eigen::Index ch = 0; ch < 3; ++ch)
        for (Eigen::Index i = 0; i < 400; ++i)
            frame.samples(ch, i) = std::sin(0.05 * static_cast<double>(i) + static_cast<double>(ch));
    const auto timestamps = frame.timestamps;

    const BandpassFilter bandpass(1.0, 100.0, 4);
    const auto result = bandpass.process(std::move(frame));
    REQUIRE(result.has_value());
    REQUIRE(result->frame.samples.rows() == 3);
    REQUIRE(result->frame.samples.cols() == 400);
    REQUIRE(result->frame.timestamps == timestamps);
    REQUIRE(result->frame.sampleRate == 1000.0);
    REQUIRE(result->annotation.empty());
}

TEST_CASE("Filter validation reports cutoffs outside Nyquist", "[dsp][operator]")
{
    REQUIRE(NotchFilter(50.0).validate(1000.0).has_value());
    REQUIRE(NotchFilter(60.0).validate(100.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(BandpassFilter(20.0, 450.0).validate(500.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(LowpassFilter(100.0).validate(0.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(*HighpassFilter(0.5).validate(250.0) == 250.0);
}

TEST_CASE("Filter on a too-short window fails with a configuration error", "[dsp][operator]")
{
    const BandpassFilter bandpass(1.0, 100.0, 4);
    const auto result = bandpass.process(makeFrame(1, 20, 1000.0));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(result.error().message.starts_with("bandpass:"));
}

TEST_CASE("Resample produces round(n * target / fs) samples", "[dsp][operator][resample]")
{
    auto frame = makeFrame(2, 1000, 1000.0, 3.0);
    for (Eigen::Index i = 0; i < 1000; ++i) {
        const double t = static_cast<double>(i) / 1000.0;
        frame.samples(0, i) = std::sin(2.0 * std::numbers::pi * 5.0 * t);
        frame.samples(1, i) = 1.0;
    }

    const Resample resample(250.0);
    REQUIRE(*resample.validate(1000.0) == 250.0);

    const auto result = resample.process(std::move(frame));
    REQUIRE(result.has_value());
    REQUIRE(result->frame.sampleRate == 250.0);
    REQUIRE(result->frame.samples.cols() == 250);
    REQUIRE(result->frame.timestamps.size() == 250);
    REQUIRE_THAT(result->frame.timestamps.front(), WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(result->frame.timestamps[1], WithinAbs(3.004, 1e-12));

    for (Eigen::Index i = 0; i < 250; ++i) {
        const double t = static_cast<double>(i) / 250.0;
        REQUIRE_THAT(result->frame.samples(0, i), WithinAbs(std::sin(2.0 * std::numbers::pi * 5.0 * t), 1e-9));
        REQUIRE_THAT(result->frame.samples(1, i), WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("Resample to the same rate returns the frame untouched", "[dsp][operator][resample]")
{
    auto frame = makeFrame(1, 64, 500.0);
    frame.samples(0, 10) = 4.0;
    const double *storage = frame.samples.data();

    const auto result = Resample(500.0).process(std::move(frame));
    REQUIRE(result.has_value());
    REQUIRE(result->frame.samples.data() == storage);
    REQUIRE(result->frame.samples(0, 10) == 4.0);
}

TEST_CASE("Resample rejects non-positive rates and empty outputs", "[dsp][operator][resample]")
{
    REQUIRE(Resample(0.0).validate(1000.0).error().code == core::ErrorCode::kInvalidConfiguration);
    REQUIRE(Resample(1.0).process(makeFrame(1, 100, 1000.0)).error().code == core::ErrorCode::kInvalidConfiguration);
}

TEST_CASE("ArtifactDetector flags channels with outliers", "[dsp][operator][artifact]")
{
    auto frame = makeFrame(3, 100, 1000.0);
    frame.samples(1, 40) = 100.0;
    frame.samples(2, 5) = -80.0;
    frame.samples(2, 70) = 90.0;

    const auto result = ArtifactDetector(6.0).process(std::move(frame));
    REQUIRE(result.has_value());
    REQUIRE(result->annotation.badSegments.size() == 1);

    const auto &segment = result->annotation.badSegments.front();
    const std::vector<std::size_t> expectedChannels{1, 2};
    REQUIRE(segment.channelIndices == expectedChannels);
    REQUIRE(segment.count == 3);
    REQUIRE(result->frame.samples(1, 40) == 100.0);
}

TEST_CASE("ArtifactDetector leaves clean and flat data unannotated", "[dsp][operator][artifact]")
{
    auto frame = makeFrame(2, 200, 1000.0);
    for (Eigen::Index i = 0; i < 200; ++i)
        frame.samples(0, i) = std::sin(0.1 * static_cast<double>(i));

    const auto result = ArtifactDetector().process(std::move(frame));
    REQUIRE(result.has_value());
    REQUIRE(result->annotation.empty());
    REQUIRE(ArtifactDetector(-1.0).validate(1000.0).error().code == core::ErrorCode::kInvalidConfiguration);
}

TEST_CASE("Detrend removes a linear trend or the mean", "[dsp][operator][detrend]")
{
    auto linear = makeFrame(1, 50, 100.0);
    for (Eigen::Index i = 0; i < 50; ++i)
        linear.samples(0, i) = 3.0 + 0.5 * static_cast<double>(i);
    auto constant = linear;

    const auto detrended = Detrend(DetrendType::kLinear).process(std::move(linear));
    REQUIRE(detrended.has_value());
    for (Eigen::Index i = 0; i < 50; ++i)
        REQUIRE_THAT(detrended->frame.samples(0, i), WithinAbs(0.0, 1e-9));

    const auto centred = Detrend(DetrendType::kConstant).process(std::move(constant));
    REQUIRE(centred.has_value());
    REQUIRE_THAT(centred->frame.samples.row(0).mean(), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(centred->frame.samples(0, 49) - centred->frame.samples(0, 0), WithinAbs(24.5, 1e-9));
}

TEST_CASE("Detrend types parse from their names", "[dsp][operator][detrend]")
{
    REQUIRE(parseDetrendType("linear") == DetrendType::kLinear);
    REQUIRE(parseDetrendType("constant") == DetrendType::kConstant);
    REQUIRE_FALSE(parseDetrendType("quadratic").has_value());
    REQUIRE(Detrend(DetrendType::kConstant).jsonize()["type"].asString() == "constant");
}

} // namespace biosig::dsp
