/**
 * @file Wavelet.cpp
 * @brief Implementation of the db4 discrete wavelet transform.
 * @author MasterLaplace
 */

#include "biosig/feature/Wavelet.hpp"

#include <algorithm>

namespace biosig::feature {

namespace {

// Index into the symmetric extension x[-1] = x[0], x[n] = x[n-1] (period 2n).
std::size_t reflect(std::ptrdiff_t index, std::size_t n) noexcept
{
    const auto period = static_cast<std::ptrdiff_t>(2 * n);
    auto m = index % period;
    if (m < 0)
        m += period;
    const auto um = static_cast<std::size_t>(m);
    return um < n ? um : 2 * n - 1 - um;
}

} // anonymous namespace

void Wavelet::step(std::span<const double> signal, std::vector<double> &approx, std::vector<double> &detail)
{
    const std::size_t n = signal.size();
    approx.clear();
    detail.clear();
    if (n == 0)
        return;

    const std::size_t outLength = (n + kFilterLength - 1) / 2;
    approx.resize(outLength);
    detail.resize(outLength);

    for (std::size_t o = 0; o < outLength; ++o) {
        const auto centre = static_cast<std::ptrdiff_t>(2 * o + 1);
        double lo = 0.0;
        double hi = 0.0;
        for (std::size_t j = 0; j < kFilterLength; ++j) {
            const double x = signal[reflect(centre - static_cast<std::ptrdiff_t>(j), n)];
            lo += kDecLow[j] * x;
            hi += kDecHigh[j] * x;
        }
        approx[o] = lo;
        detail[o] = hi;
    }
}

std::vector<std::vector<double>> Wavelet::decompose(std::span<const double> signal, std::size_t levels)
{
    std::vector<std::vector<double>> details;
    std::vector<double> current(signal.begin(), signal.end());
    std::vector<double> approx;
    std::vector<double> detail;

    for (std::size_t level = 0; level < levels && !current.empty(); ++level) {
        step(current, approx, detail);
        details.push_back(detail);
        current.swap(approx);
    }

    std::vector<std::vector<double>> bands;
    bands.reserve(details.size() + 1);
    bands.push_back(std::move(current));
    for (auto it = details.rbegin(); it != details.rend(); ++it)
        bands.push_back(std::move(*it));
    return bands;
}

std::vector<double> Wavelet::bandEnergies(std::span<const double> signal, std::size_t levels)
{
    const auto bands = decompose(signal, levels);
    std::vector<double> energies;
    energies.reserve(bands.size());
    for (const auto &band : bands) {
        double e = 0.0;
        for (const double c : band)
            e += c * c;
        energies.push_back(e);
    }
    return energies;
}

std::size_t Wavelet::maxUsefulLevel(std::size_t signalLength) noexcept
{
    if (signalLength < kFilterLength - 1)
        return 0;
    std::size_t level = 0;
    std::size_t length = signalLength;
    while (length >= 2 * (kFilterLength - 1)) {
        length /= 2;
        ++level;
    }
    return level;
}

} // namespace biosig::feature
