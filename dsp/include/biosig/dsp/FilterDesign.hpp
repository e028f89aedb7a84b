/**
 * @file FilterDesign.hpp
 * @brief Digital IIR filter design as cascades of second-order sections.
 * @author MasterLaplace
 *
 * Butterworth prototypes are designed in the analog domain, frequency
 * transformed, mapped with the bilinear transform (pre-warped cutoffs)
 * and factored into biquads. All frequencies are normalized to the
 * Nyquist frequency, i.e. lie in (0, 1).
 */

#pragma once

#include "biosig/core/Expected.hpp"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace biosig::dsp {

/**
 * @brief One second-order section, a[0] normalized to 1.
 *
 * First-order sections carry zeros in b[2] and a[2].
 */
struct Biquad {
    std::array<double, 3> b{1.0, 0.0, 0.0};
    std::array<double, 3> a{1.0, 0.0, 0.0};
};

using SosCascade = std::vector<Biquad>;

enum class FilterBand : std::uint8_t {
    kLowpass,
    kHighpass,
    kBandpass
};

[[nodiscard]] constexpr std::string_view filterBandName(FilterBand band) noexcept
{
    switch (band) {
        case FilterBand::kLowpass:  return "lowpass";
        case FilterBand::kHighpass: return "highpass";
        case FilterBand::kBandpass: return "bandpass";
    }
    return "unknown";
}

/**
 * @brief Designs a digital Butterworth filter.
 *
 * @param order Prototype order (band-pass filters get 2 * order poles)
 * @param band  Response type
 * @param wLow  Normalized cutoff (or lower edge for band-pass)
 * @param wHigh Normalized upper edge, ignored unless band-pass
 * @return The SOS cascade, or kInvalidConfiguration
 */
[[nodiscard]] core::Expected<SosCascade> designButterworth(
    int order, FilterBand band, double wLow, double wHigh = 0.0);

/**
 * @brief Designs a second-order IIR notch with -3 dB bandwidth w0 / q.
 *
 * @param w0 Normalized notch frequency
 * @param q  Quality factor, > 0
 */
[[nodiscard]] core::Expected<SosCascade> designNotch(double w0, double q);

/**
 * @brief |H(e^jw)| of the cascade at normalized frequency @p w.
 */
[[nodiscard]] double magnitudeResponse(const SosCascade &sos, double w) noexcept;

} // namespace biosig::dsp
