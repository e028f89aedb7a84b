/**
 * @file SampleFrame.hpp
 * @brief Vocabulary types flowing through the operator pipeline.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <span>
#include <vector>

namespace biosig::dsp {

// ─── Sample Matrix ───────────────────────────────────────────────────────────

/**
 * @brief Multichannel samples: one row per channel, one column per sample.
 *
 * Row-major so that a single channel is a contiguous span.
 */
using SampleMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Read-only view of one channel of a SampleMatrix.
 */
[[nodiscard]] inline std::span<const double> channelView(const SampleMatrix &m, Eigen::Index channel) noexcept
{
    return {m.data() + channel * m.cols(), static_cast<std::size_t>(m.cols())};
}

/**
 * @brief Mutable view of one channel of a SampleMatrix.
 */
[[nodiscard]] inline std::span<double> channelView(SampleMatrix &m, Eigen::Index channel) noexcept
{
    return {m.data() + channel * m.cols(), static_cast<std::size_t>(m.cols())};
}

// ─── Sample Frame ────────────────────────────────────────────────────────────

/**
 * @brief A window of multichannel samples with per-sample timestamps.
 *
 * Primary data unit handed from one operator to the next. Timestamps are
 * in seconds, non-decreasing, one per column of @ref samples.
 */
struct SampleFrame {
    SampleMatrix samples;
    std::vector<double> timestamps;
    double sampleRate = 0.0;

    [[nodiscard]] std::size_t channelCount() const noexcept { return static_cast<std::size_t>(samples.rows()); }
    [[nodiscard]] std::size_t sampleCount() const noexcept { return static_cast<std::size_t>(samples.cols()); }
    [[nodiscard]] bool empty() const noexcept { return samples.size() == 0; }
};

// ─── Annotation ──────────────────────────────────────────────────────────────

/**
 * @brief Samples flagged by a detector, grouped over the channels involved.
 */
struct BadSegment {
    std::vector<std::size_t> channelIndices;
    std::size_t count = 0;
};

/**
 * @brief Side information an operator attaches to its output.
 *
 * Empty for pure transforms.
 */
struct Annotation {
    std::vector<BadSegment> badSegments;

    [[nodiscard]] bool empty() const noexcept { return badSegments.empty(); }
};

} // namespace biosig::dsp
