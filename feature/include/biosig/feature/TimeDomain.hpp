/**
 * @file TimeDomain.hpp
 * @brief Amplitude and distribution statistics of a single-channel window.
 * @author MasterLaplace
 */

#pragma once

#include <span>

namespace biosig::feature {

struct TimeDomainFeatures {
    double mean = 0.0;
    double std = 0.0;
    double rms = 0.0;
    double iemg = 0.0;
    double mav = 0.0;
    double wl = 0.0;
    double zc = 0.0;
    double median = 0.0;
    double iqr = 0.0;
    double skew = 0.0;
    double kurtosis = 0.0;
};

class TimeDomain final {
public:
    TimeDomain() = delete;

    /**
     * @brief Computes every time-domain feature of @p signal.
     *
     * std is the population standard deviation; skew and kurtosis are the
     * biased sample moments (kurtosis in Fisher form, i.e. excess over a
     * normal distribution). Both are zero for a constant signal.
     *
     * @param signal Non-empty window
     */
    [[nodiscard]] static TimeDomainFeatures compute(std::span<const double> signal);

    /**
     * @brief Linear-interpolated percentile.
     * @param sorted Ascending, non-empty samples.
     * @param q      Percentile in [0, 100].
     */
    [[nodiscard]] static double percentile(std::span<const double> sorted, double q) noexcept;

    /**
     * @brief Number of adjacent sample pairs with strictly opposite signs.
     */
    [[nodiscard]] static std::size_t zeroCrossings(std::span<const double> signal) noexcept;
};

} // namespace biosig::feature
