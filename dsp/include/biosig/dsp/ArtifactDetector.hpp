/**
 * @file ArtifactDetector.hpp
 * @brief Diagnostic z-score outlier detector.
 * @author MasterLaplace
 */

#pragma once

#include "biosig/dsp/IOperator.hpp"

namespace biosig::dsp {

/**
 * @brief Flags samples whose z-score against their own channel's mean and
 *        standard deviation exceeds a threshold.
 *
 * The data passes through untouched. When anything is flagged the
 * annotation holds one BadSegment listing the affected channels (sorted,
 * unique) and the total flagged-sample count; otherwise it is empty.
 */
class ArtifactDetector final : public IOperator {
public:
    static constexpr std::string_view kName = "artifact_detector";

    explicit ArtifactDetector(double zThreshold = 6.0);

    [[nodiscard]] core::Expected<OperatorOutput> process(SampleFrame frame) const override;
    [[nodiscard]] core::Expected<double> validate(double sampleRate) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

private:
    double _zThreshold;
};

} // namespace biosig::dsp
