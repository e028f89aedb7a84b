/**
 * @file ZeroPhaseFilter.hpp
 * @brief Forward-backward filtering of a SOS cascade.
 * @author MasterLaplace
 *
 * The signal is extended at both ends by odd reflection, filtered forward
 * from steady-state initial conditions, then filtered again on the reversed
 * output. The result has zero phase and the squared magnitude response of
 * the cascade.
 */

#pragma once

#include "biosig/core/Expected.hpp"
#include "biosig/dsp/FilterDesign.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <vector>

namespace biosig::dsp {

using SosState = std::vector<std::array<double, 2>>;

/**
 * @brief Number of samples reflected at each end of the signal.
 *
 * Three times the length of the equivalent transfer-function numerator.
 */
[[nodiscard]] std::size_t padLength(const SosCascade &sos) noexcept;

/**
 * @brief Initial state giving the steady-state response to a unit step.
 */
[[nodiscard]] SosState steadyStateInit(const SosCascade &sos);

/**
 * @brief Single causal pass, transposed direct form II, in place.
 *
 * @param state Per-section delay line, updated on return
 */
void sosFilter(const SosCascade &sos, std::span<double> signal, SosState &state) noexcept;

/**
 * @brief Zero-phase filtering in place.
 *
 * @return kInvalidConfiguration when the signal is not longer than
 *         padLength(sos)
 */
[[nodiscard]] core::ExpectedVoid sosFiltFilt(const SosCascade &sos, std::span<double> signal);

} // namespace biosig::dsp
