/**
 * @file Resample.hpp
 * @brief Fourier-domain resampling operator.
 * @author MasterLaplace
 *
 * Changes the sampling rate seen by every downstream operator and by the
 * feature extractor's window sizing.
 */

#pragma once

#include "biosig/dsp/IOperator.hpp"

#include <span>
#include <vector>

namespace biosig::dsp {

/**
 * @brief Resamples a real signal to @p outputCount samples by truncating
 *        or zero-padding its spectrum (periodic signal assumption).
 */
[[nodiscard]] std::vector<double> fourierResample(std::span<const double> input, std::size_t outputCount);

/**
 * @brief Resamples every channel to a target sampling rate.
 *
 * When the input rate already equals the target the frame is returned
 * unchanged (same storage). Otherwise the output holds
 * round(n * target / fs) samples and timestamps are regenerated from the
 * first input timestamp with a 1 / target spacing.
 */
class Resample final : public IOperator {
public:
    static constexpr std::string_view kName = "resample";

    explicit Resample(double targetRate = 250.0);

    [[nodiscard]] core::Expected<OperatorOutput> process(SampleFrame frame) const override;
    [[nodiscard]] core::Expected<double> validate(double sampleRate) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

    [[nodiscard]] double targetRate() const noexcept { return _targetRate; }

private:
    double _targetRate;
};

} // namespace biosig::dsp
