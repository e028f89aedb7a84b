/**
 * @file FilterDesign.cpp
 * @brief Butterworth and notch designs via analog prototypes and the
 *        bilinear transform.
 * @author MasterLaplace
 */

#include "biosig/dsp/FilterDesign.hpp"

#include <cmath>
#include <complex>
#include <format>
#include <numbers>

namespace biosig::dsp {

namespace {

using Complex = std::complex<double>;

constexpr int kMaxOrder = 16;
constexpr double kRealTolerance = 1e-10;

// Sample rate of the normalized digital domain, as used by the bilinear map.
constexpr double kBilinearFs2 = 4.0;

struct Zpk {
    std::vector<Complex> zeros;
    std::vector<Complex> poles;
    double gain = 1.0;
};

Zpk butterworthPrototype(int order)
{
    Zpk proto;
    for (int m = -order + 1; m < order; m += 2) {
        const double theta = std::numbers::pi * static_cast<double>(m) / (2.0 * order);
        proto.poles.push_back(-std::exp(Complex(0.0, theta)));
    }
    return proto;
}

double prewarp(double w)
{
    return kBilinearFs2 * std::tan(std::numbers::pi * w / 2.0);
}

Zpk toLowpass(Zpk proto, double wo)
{
    for (auto &p : proto.poles)
        p *= wo;
    proto.gain *= std::pow(wo, static_cast<double>(proto.poles.size()));
    return proto;
}

Zpk toHighpass(Zpk proto, double wo)
{
    Complex prodNegP(1.0, 0.0);
    for (auto &p : proto.poles) {
        prodNegP *= -p;
        p = wo / p;
    }
    proto.gain *= (1.0 / prodNegP).real();
    proto.zeros.assign(proto.poles.size(), Complex(0.0, 0.0));
    return proto;
}

Zpk toBandpass(const Zpk &proto, double wo, double bw)
{
    Zpk out;
    const auto degree = proto.poles.size();
    std::vector<Complex> scaled;
    scaled.reserve(degree);
    for (const auto &p : proto.poles)
        scaled.push_back(p * bw / 2.0);
    for (const auto &p : scaled)
        out.poles.push_back(p + std::sqrt(p * p - wo * wo));
    for (const auto &p : scaled)
        out.poles.push_back(p - std::sqrt(p * p - wo * wo));
    out.zeros.assign(degree, Complex(0.0, 0.0));
    out.gain = proto.gain * std::pow(bw, static_cast<double>(degree));
    return out;
}

Zpk bilinear(const Zpk &analog)
{
    Zpk digital;
    Complex num(1.0, 0.0);
    Complex den(1.0, 0.0);
    for (const auto &z : analog.zeros) {
        digital.zeros.push_back((kBilinearFs2 + z) / (kBilinearFs2 - z));
        num *= kBilinearFs2 - z;
    }
    for (const auto &p : analog.poles) {
        digital.poles.push_back((kBilinearFs2 + p) / (kBilinearFs2 - p));
        den *= kBilinearFs2 - p;
    }
    // Zeros at infinity map to Nyquist.
    digital.zeros.resize(digital.poles.size(), Complex(-1.0, 0.0));
    digital.gain = analog.gain * (num / den).real();
    return digital;
}

/**
 * Groups the poles into conjugate pairs (or pairs of real poles) and gives
 * every section the numerator its band type implies: zeros at -1 for
 * low-pass, +1 for high-pass, one of each for band-pass.
 */
SosCascade toSections(const Zpk &digital, FilterBand band)
{
    std::vector<Complex> complexPoles;
    std::vector<double> realPoles;
    for (const auto &p : digital.poles) {
        if (std::abs(p.imag()) <= kRealTolerance * std::max(1.0, std::abs(p)))
            realPoles.push_back(p.real());
        else if (p.imag() > 0.0)
            complexPoles.push_back(p);
    }

    const std::array<double, 3> secondOrderB = [band] {
        switch (band) {
            case FilterBand::kLowpass:  return std::array<double, 3>{1.0, 2.0, 1.0};
            case FilterBand::kHighpass: return std::array<double, 3>{1.0, -2.0, 1.0};
            case FilterBand::kBandpass: return std::array<double, 3>{1.0, 0.0, -1.0};
        }
        return std::array<double, 3>{1.0, 0.0, 0.0};
    }();
    const std::array<double, 3> firstOrderB = band == FilterBand::kHighpass
        ? std::array<double, 3>{1.0, -1.0, 0.0}
        : std::array<double, 3>{1.0, 1.0, 0.0};

    SosCascade sos;
    for (const auto &p : complexPoles)
        sos.push_back(Biquad{secondOrderB, {1.0, -2.0 * p.real(), std::norm(p)}});

    std::size_t i = 0;
    for (; i + 1 < realPoles.size(); i += 2) {
        const double p1 = realPoles[i];
        const double p2 = realPoles[i + 1];
        sos.push_back(Biquad{secondOrderB, {1.0, -(p1 + p2), p1 * p2}});
    }
    if (i < realPoles.size())
        sos.push_back(Biquad{firstOrderB, {1.0, -realPoles[i], 0.0}});

    if (!sos.empty()) {
        for (auto &coeff : sos.front().b)
            coeff *= digital.gain;
    }
    return sos;
}

core::Error badCutoff(std::string what)
{
    return core::Error::make(core::ErrorCode::kInvalidConfiguration, std::move(what));
}

} // anonymous namespace

core::Expected<SosCascade> designButterworth(int order, FilterBand band, double wLow, double wHigh)
{
    if (order < 1 || order > kMaxOrder) {
        return std::unexpected(badCutoff(
            std::format("Butterworth order must be in [1, {}], got {}", kMaxOrder, order)));
    }
    if (!(wLow > 0.0 && wLow < 1.0)) {
        return std::unexpected(badCutoff(
            std::format("{} cutoff {} is outside (0, Nyquist)", filterBandName(band), wLow)));
    }

    const Zpk proto = butterworthPrototype(order);
    Zpk analog;
    switch (band) {
        case FilterBand::kLowpass:
            analog = toLowpass(proto, prewarp(wLow));
            break;
        case FilterBand::kHighpass:
            analog = toHighpass(proto, prewarp(wLow));
            break;
        case FilterBand::kBandpass: {
            if (!(wHigh > wLow && wHigh < 1.0)) {
                return std::unexpected(badCutoff(std::format(
                    "bandpass edges ({}, {}) must satisfy 0 < low < high < Nyquist", wLow, wHigh)));
            }
            const double lo = prewarp(wLow);
            const double hi = prewarp(wHigh);
            analog = toBandpass(proto, std::sqrt(lo * hi), hi - lo);
            break;
        }
    }
    return toSections(bilinear(analog), band);
}

core::Expected<SosCascade> designNotch(double w0, double q)
{
    if (!(w0 > 0.0 && w0 < 1.0))
        return std::unexpected(badCutoff(std::format("notch frequency {} is outside (0, Nyquist)", w0)));
    if (!(q > 0.0))
        return std::unexpected(badCutoff(std::format("notch quality factor must be > 0, got {}", q)));

    const double bw = std::numbers::pi * w0 / q;
    const double wc = std::numbers::pi * w0;
    const double beta = std::tan(bw / 2.0);
    const double gain = 1.0 / (1.0 + beta);
    const double c = std::cos(wc);

    return SosCascade{Biquad{
        {gain, -2.0 * gain * c, gain},
        {1.0, -2.0 * gain * c, 2.0 * gain - 1.0}}};
}

double magnitudeResponse(const SosCascade &sos, double w) noexcept
{
    const Complex z1 = std::exp(Complex(0.0, -std::numbers::pi * w));
    const Complex z2 = z1 * z1;
    Complex h(1.0, 0.0);
    for (const auto &s : sos)
        h *= (s.b[0] + s.b[1] * z1 + s.b[2] * z2) / (s.a[0] + s.a[1] * z1 + s.a[2] * z2);
    return std::abs(h);
}

} // namespace biosig::dsp
