/**
 * @file Detrend.cpp
 * @brief Implementation of the Detrend operator.
 * @author MasterLaplace
 */

#include "biosig/dsp/Detrend.hpp"

namespace biosig::dsp {

std::optional<DetrendType> parseDetrendType(std::string_view text) noexcept
{
    if (text == "linear")
        return DetrendType::kLinear;
    if (text == "constant")
        return DetrendType::kConstant;
    return std::nullopt;
}

Detrend::Detrend(DetrendType type)
    : _type(type)
{
}

core::Expected<double> Detrend::validate(double sampleRate) const
{
    return sampleRate;
}

core::Expected<OperatorOutput> Detrend::process(SampleFrame frame) const
{
    const Eigen::Index n = frame.samples.cols();
    if (n == 0)
        return OperatorOutput{std::move(frame), {}};

    const Eigen::ArrayXd t = Eigen::ArrayXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));
    const Eigen::ArrayXd tc = t - t.mean();
    const double tss = tc.square().sum();

    for (Eigen::Index ch = 0; ch < frame.samples.rows(); ++ch) {
        auto row = frame.samples.row(ch).array();
        const double mean = row.mean();
        if (_type == DetrendType::kConstant || tss == 0.0) {
            row -= mean;
            continue;
        }
        const double slope = ((row - mean).transpose() * tc).sum() / tss;
        row -= mean + slope * tc.transpose();
    }
    return OperatorOutput{std::move(frame), {}};
}

Json::Value Detrend::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["type"] = std::string(detrendTypeName(_type));
    return j;
}

} // namespace biosig::dsp
