/**
 * @file TimeDomain.cpp
 * @brief Implementation of the time-domain feature group.
 * @author MasterLaplace
 */

#include "biosig/feature/TimeDomain.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace biosig::feature {

TimeDomainFeatures TimeDomain::compute(std::span<const double> signal)
{
    TimeDomainFeatures f;
    if (signal.empty())
        return f;

    const auto n = static_cast<double>(signal.size());

    double sum = 0.0;
    double sumSq = 0.0;
    double sumAbs = 0.0;
    for (const double x : signal) {
        sum += x;
        sumSq += x * x;
        sumAbs += std::abs(x);
    }
    f.mean = sum / n;
    f.rms = std::sqrt(sumSq / n);
    f.iemg = sumAbs;
    f.mav = sumAbs / n;

    double m2 = 0.0;
    double m3 = 0.0;
    double m4 = 0.0;
    for (const double x : signal) {
        const double d = x - f.mean;
        const double d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    m2 /= n;
    m3 /= n;
    m4 /= n;
    f.std = std::sqrt(m2);
    if (m2 > 0.0) {
        f.skew = m3 / std::pow(m2, 1.5);
        f.kurtosis = m4 / (m2 * m2) - 3.0;
    }

    for (std::size_t i = 1; i < signal.size(); ++i)
        f.wl += std::abs(signal[i] - signal[i - 1]);
    f.zc = static_cast<double>(zeroCrossings(signal));

    std::vector<double> sorted(signal.begin(), signal.end());
    std::sort(sorted.begin(), sorted.end());
    f.median = percentile(sorted, 50.0);
    f.iqr = percentile(sorted, 75.0) - percentile(sorted, 25.0);

    return f;
}

double TimeDomain::percentile(std::span<const double> sorted, double q) noexcept
{
    if (sorted.empty())
        return 0.0;
    const double rank = q / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(rank));
    const auto hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

std::size_t TimeDomain::zeroCrossings(std::span<const double> signal) noexcept
{
    std::size_t count = 0;
    for (std::size_t i = 1; i < signal.size(); ++i) {
        if (signal[i - 1] * signal[i] < 0.0)
            ++count;
    }
    return count;
}

} // namespace biosig::feature
