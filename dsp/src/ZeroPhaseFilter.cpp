/**
 * @file ZeroPhaseFilter.cpp
 * @brief Odd-extension forward-backward SOS filtering.
 * @author MasterLaplace
 */

#include "biosig/dsp/ZeroPhaseFilter.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <format>

namespace biosig::dsp {

std::size_t padLength(const SosCascade &sos) noexcept
{
    std::size_t trailingZeroB = 0;
    std::size_t trailingZeroA = 0;
    for (const auto &s : sos) {
        trailingZeroB += s.b[2] == 0.0 ? 1 : 0;
        trailingZeroA += s.a[2] == 0.0 ? 1 : 0;
    }
    const auto taps = 2 * sos.size() + 1 - std::min(trailingZeroB, trailingZeroA);
    return 3 * taps;
}

SosState steadyStateInit(const SosCascade &sos)
{
    SosState zi(sos.size());
    double scale = 1.0;
    for (std::size_t i = 0; i < sos.size(); ++i) {
        const auto &[b, a] = sos[i];
        Eigen::Matrix2d m;
        m << 1.0 + a[1], -1.0,
             a[2],        1.0;
        const Eigen::Vector2d rhs(b[1] - a[1] * b[0], b[2] - a[2] * b[0]);
        const Eigen::Vector2d z = m.partialPivLu().solve(rhs);
        zi[i] = {scale * z(0), scale * z(1)};
        scale *= (b[0] + b[1] + b[2]) / (a[0] + a[1] + a[2]);
    }
    return zi;
}

void sosFilter(const SosCascade &sos, std::span<double> signal, SosState &state) noexcept
{
    for (std::size_t s = 0; s < sos.size(); ++s) {
        const auto &[b, a] = sos[s];
        auto &[z0, z1] = state[s];
        for (auto &x : signal) {
            const double y = b[0] * x + z0;
            z0 = b[1] * x - a[1] * y + z1;
            z1 = b[2] * x - a[2] * y;
            x = y;
        }
    }
}

core::ExpectedVoid sosFiltFilt(const SosCascade &sos, std::span<double> signal)
{
    const auto pad = padLength(sos);
    const auto n = signal.size();
    if (n <= pad) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("zero-phase filter needs more than {} samples, got {}", pad, n)));
    }

    std::vector<double> ext(n + 2 * pad);
    const double first = signal.front();
    const double last = signal.back();
    for (std::size_t i = 0; i < pad; ++i) {
        ext[i] = 2.0 * first - signal[pad - i];
        ext[pad + n + i] = 2.0 * last - signal[n - 2 - i];
    }
    std::copy(signal.begin(), signal.end(), ext.begin() + static_cast<std::ptrdiff_t>(pad));

    const SosState zi = steadyStateInit(sos);

    SosState state = zi;
    for (auto &z : state) {
        z[0] *= ext.front();
        z[1] *= ext.front();
    }
    sosFilter(sos, ext, state);

    std::reverse(ext.begin(), ext.end());
    state = zi;
    for (auto &z : state) {
        z[0] *= ext.front();
        z[1] *= ext.front();
    }
    sosFilter(sos, ext, state);
    std::reverse(ext.begin(), ext.end());

    std::copy_n(ext.begin() + static_cast<std::ptrdiff_t>(pad), n, signal.begin());
    return {};
}

} // namespace biosig::dsp
