/**
 * @file Spectral.cpp
 * @brief Welch PSD on top of Eigen's FFT module.
 * @author MasterLaplace
 */

#include "biosig/feature/Spectral.hpp"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>

namespace biosig::feature {

namespace {

std::vector<double> periodicHann(std::size_t length)
{
    if (length <= 1)
        return std::vector<double>(length, 1.0);
    std::vector<double> w(length);
    for (std::size_t i = 0; i < length; ++i) {
        w[i] = 0.5 - 0.5 * std::cos(
            2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(length));
    }
    return w;
}

} // anonymous namespace

PowerSpectrum Spectral::welch(std::span<const double> signal, double sampleRate, std::size_t maxSegment)
{
    PowerSpectrum psd;
    const std::size_t n = signal.size();
    if (n == 0 || maxSegment == 0 || !(sampleRate > 0.0))
        return psd;

    const std::size_t segment = std::min(maxSegment, n);
    const std::size_t overlap = segment / 2;
    const std::size_t step = segment - overlap;
    const std::size_t segments = (n - overlap) / step;
    const std::size_t bins = segment / 2 + 1;

    const auto window = periodicHann(segment);
    double windowPower = 0.0;
    for (const double w : window)
        windowPower += w * w;
    const double scale = 1.0 / (sampleRate * windowPower);

    psd.frequencies.resize(bins);
    psd.density.assign(bins, 0.0);
    for (std::size_t k = 0; k < bins; ++k)
        psd.frequencies[k] = static_cast<double>(k) * sampleRate / static_cast<double>(segment);

    Eigen::FFT<double> fft;
    std::vector<double> buffer(segment);
    std::vector<std::complex<double>> spectrum;

    for (std::size_t s = 0; s < segments; ++s) {
        const auto chunk = signal.subspan(s * step, segment);
        double mean = 0.0;
        for (const double x : chunk)
            mean += x;
        mean /= static_cast<double>(segment);
        for (std::size_t i = 0; i < segment; ++i)
            buffer[i] = (chunk[i] - mean) * window[i];

        fft.fwd(spectrum, buffer);
        for (std::size_t k = 0; k < bins; ++k)
            psd.density[k] += std::norm(spectrum[k]) * scale;
    }

    // Fold negative frequencies in; DC and an even-length Nyquist bin are unique.
    const std::size_t lastDoubled = segment % 2 == 0 ? bins - 1 : bins;
    for (std::size_t k = 1; k < lastDoubled; ++k)
        psd.density[k] *= 2.0;
    for (auto &p : psd.density)
        p /= static_cast<double>(segments);

    return psd;
}

double Spectral::totalPower(const PowerSpectrum &psd) noexcept
{
    double total = 0.0;
    for (std::size_t k = 1; k < psd.density.size(); ++k) {
        total += 0.5 * (psd.density[k] + psd.density[k - 1])
               * (psd.frequencies[k] - psd.frequencies[k - 1]);
    }
    return total;
}

double Spectral::medianFrequency(const PowerSpectrum &psd) noexcept
{
    if (psd.density.empty())
        return 0.0;

    std::vector<double> cumulative(psd.density.size());
    double running = 0.0;
    for (std::size_t k = 0; k < psd.density.size(); ++k) {
        running += psd.density[k];
        cumulative[k] = running;
    }
    if (!(running > 0.0))
        return 0.0;

    const double half = running / 2.0;
    if (half <= cumulative.front())
        return psd.frequencies.front();

    // Last index whose cumulative value does not exceed half.
    const auto upper = std::upper_bound(cumulative.begin(), cumulative.end(), half);
    const auto j = static_cast<std::size_t>(upper - cumulative.begin()) - 1;
    if (j + 1 >= cumulative.size())
        return psd.frequencies.back();

    const double x0 = cumulative[j];
    const double x1 = cumulative[j + 1];
    const double f0 = psd.frequencies[j];
    const double f1 = psd.frequencies[j + 1];
    return f0 + (half - x0) * (f1 - f0) / (x1 - x0);
}

} // namespace biosig::feature
