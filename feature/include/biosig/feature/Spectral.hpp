/**
 * @file Spectral.hpp
 * @brief Welch power spectral density and derived summary features.
 * @author MasterLaplace
 */

#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace biosig::feature {

/**
 * @brief One-sided PSD estimate (power per Hz) and its frequency axis.
 */
struct PowerSpectrum {
    std::vector<double> frequencies;
    std::vector<double> density;
};

class Spectral final {
public:
    Spectral() = delete;

    /**
     * @brief Welch's method with a periodic Hann window.
     *
     * Segment length min(maxSegment, n), 50 % overlap, mean removed from
     * each segment, density scaling, segments averaged.
     *
     * @param signal     Non-empty window
     * @param sampleRate Sampling rate in Hz
     * @param maxSegment Upper bound on the segment length
     */
    [[nodiscard]] static PowerSpectrum welch(
        std::span<const double> signal, double sampleRate, std::size_t maxSegment = 256);

    /**
     * @brief Trapezoidal integral of the PSD over frequency.
     */
    [[nodiscard]] static double totalPower(const PowerSpectrum &psd) noexcept;

    /**
     * @brief Frequency at which the cumulative PSD reaches half its final
     *        value, linearly interpolated. Zero when there is no power.
     */
    [[nodiscard]] static double medianFrequency(const PowerSpectrum &psd) noexcept;
};

} // namespace biosig::feature
