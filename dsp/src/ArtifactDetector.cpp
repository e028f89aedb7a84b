/**
 * @file ArtifactDetector.cpp
 * @brief Implementation of the z-score artifact detector.
 * @author MasterLaplace
 */

#include "biosig/dsp/ArtifactDetector.hpp"

#include <cmath>
#include <format>

namespace biosig::dsp {

namespace {

constexpr double kStdEpsilon = 1e-12;

} // anonymous namespace

ArtifactDetector::ArtifactDetector(double zThreshold)
    : _zThreshold(zThreshold)
{
}

core::Expected<double> ArtifactDetector::validate(double sampleRate) const
{
    if (!(_zThreshold > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("artifact_detector: z threshold must be > 0, got {}", _zThreshold)));
    }
    return sampleRate;
}

core::Expected<OperatorOutput> ArtifactDetector::process(SampleFrame frame) const
{
    BadSegment segment;
    for (Eigen::Index ch = 0; ch < frame.samples.rows(); ++ch) {
        const auto row = frame.samples.row(ch).array();
        if (row.size() == 0)
            continue;
        const double mean = row.mean();
        const double stddev = std::sqrt((row - mean).square().mean());
        const auto flagged = static_cast<std::size_t>(
            ((row - mean).abs() / (stddev + kStdEpsilon) > _zThreshold).count());
        if (flagged > 0) {
            segment.channelIndices.push_back(static_cast<std::size_t>(ch));
            segment.count += flagged;
        }
    }

    Annotation annotation;
    if (segment.count > 0)
        annotation.badSegments.push_back(std::move(segment));
    return OperatorOutput{std::move(frame), std::move(annotation)};
}

Json::Value ArtifactDetector::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["z_thresh"] = _zThreshold;
    return j;
}

} // namespace biosig::dsp
