/**
 * @file Detrend.hpp
 * @brief Per-channel removal of a least-squares line or of the mean.
 * @author MasterLaplace
 */

#pragma once

#include "biosig/dsp/IOperator.hpp"

#include <cstdint>
#include <optional>

namespace biosig::dsp {

enum class DetrendType : std::uint8_t {
    kLinear,
    kConstant
};

[[nodiscard]] constexpr std::string_view detrendTypeName(DetrendType type) noexcept
{
    switch (type) {
        case DetrendType::kLinear:   return "linear";
        case DetrendType::kConstant: return "constant";
    }
    return "linear";
}

[[nodiscard]] std::optional<DetrendType> parseDetrendType(std::string_view text) noexcept;

class Detrend final : public IOperator {
public:
    static constexpr std::string_view kName = "detrend";

    explicit Detrend(DetrendType type = DetrendType::kLinear);

    [[nodiscard]] core::Expected<OperatorOutput> process(SampleFrame frame) const override;
    [[nodiscard]] core::Expected<double> validate(double sampleRate) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

private:
    DetrendType _type;
};

} // namespace biosig::dsp
