/**
 * @file Wavelet.hpp
 * @brief Multilevel discrete wavelet decomposition with the Daubechies-4 basis.
 * @author MasterLaplace
 *
 * Uses half-sample symmetric extension at both boundaries, so a level
 * applied to n samples yields floor((n + 7) / 2) coefficients per band.
 */

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <vector>

namespace biosig::feature {

class Wavelet final {
public:
    Wavelet() = delete;

    static constexpr std::size_t kFilterLength = 8;

    /** @brief db4 decomposition low-pass filter. */
    static constexpr std::array<double, kFilterLength> kDecLow{
        -0.010597401784997278, 0.032883011666982945, 0.030841381835986965, -0.18703481171888114,
        -0.02798376941698385,  0.6308807679295904,   0.7148465705525415,   0.23037781330885523};

    /** @brief db4 decomposition high-pass filter (quadrature mirror of kDecLow). */
    static constexpr std::array<double, kFilterLength> kDecHigh{
        -0.23037781330885523,  0.7148465705525415,  -0.6308807679295904,  -0.02798376941698385,
         0.18703481171888114,  0.030841381835986965, -0.032883011666982945, -0.010597401784997278};

    /**
     * @brief Single-level transform.
     * @param[out] approx Approximation coefficients.
     * @param[out] detail Detail coefficients.
     */
    static void step(std::span<const double> signal, std::vector<double> &approx, std::vector<double> &detail);

    /**
     * @brief Decomposes @p signal over @p levels levels.
     *
     * @return Coefficient bands ordered [cA_L, cD_L, cD_L-1, ..., cD_1]
     */
    [[nodiscard]] static std::vector<std::vector<double>> decompose(std::span<const double> signal, std::size_t levels);

    /**
     * @brief Sum of squared coefficients of every band, in decompose() order.
     */
    [[nodiscard]] static std::vector<double> bandEnergies(std::span<const double> signal, std::size_t levels);

    /**
     * @brief Deepest level at which the filter still fits the signal.
     */
    [[nodiscard]] static std::size_t maxUsefulLevel(std::size_t signalLength) noexcept;
};

} // namespace biosig::feature
