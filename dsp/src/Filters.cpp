/**
 * @file Filters.cpp
 * @brief Implementation of the zero-phase filter operators.
 * @author MasterLaplace
 */

#include "biosig/dsp/Filters.hpp"
#include "biosig/dsp/ZeroPhaseFilter.hpp"

#include <format>

namespace biosig::dsp {

namespace {

core::Expected<double> nyquist(double sampleRate, std::string_view op)
{
    if (!(sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("{}: sampling rate must be > 0, got {}", op, sampleRate)));
    }
    return sampleRate / 2.0;
}

} // anonymous namespace

// ─── ZeroPhaseOperator ───────────────────────────────────────────────────────

core::Expected<OperatorOutput> ZeroPhaseOperator::process(SampleFrame frame) const
{
    const auto sos = design(frame.sampleRate);
    if (!sos)
        return std::unexpected(sos.error());

    for (Eigen::Index ch = 0; ch < frame.samples.rows(); ++ch) {
        auto result = sosFiltFilt(*sos, channelView(frame.samples, ch));
        if (!result) {
            result.error().message = std::format("{}: {}", name(), result.error().message);
            return std::unexpected(std::move(result.error()));
        }
    }
    return OperatorOutput{std::move(frame), {}};
}

core::Expected<double> ZeroPhaseOperator::validate(double sampleRate) const
{
    const auto sos = design(sampleRate);
    if (!sos)
        return std::unexpected(sos.error());
    return sampleRate;
}

// ─── NotchFilter ─────────────────────────────────────────────────────────────

NotchFilter::NotchFilter(double frequency, double quality)
    : _frequency(frequency), _quality(quality)
{
}

core::Expected<SosCascade> NotchFilter::design(double sampleRate) const
{
    const double nyq = BIOSIG_TRY(nyquist(sampleRate, kName));
    return designNotch(_frequency / nyq, _quality);
}

Json::Value NotchFilter::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["freq"] = _frequency;
    j["q"] = _quality;
    return j;
}

// ─── BandpassFilter ──────────────────────────────────────────────────────────

BandpassFilter::BandpassFilter(double low, double high, int order)
    : _low(low), _high(high), _order(order)
{
}

core::Expected<SosCascade> BandpassFilter::design(double sampleRate) const
{
    const double nyq = BIOSIG_TRY(nyquist(sampleRate, kName));
    return designButterworth(_order, FilterBand::kBandpass, _low / nyq, _high / nyq);
}

Json::Value BandpassFilter::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["low"] = _low;
    j["high"] = _high;
    j["order"] = _order;
    return j;
}

// ─── HighpassFilter ──────────────────────────────────────────────────────────

HighpassFilter::HighpassFilter(double cutoff, int order)
    : _cutoff(cutoff), _order(order)
{
}

core::Expected<SosCascade> HighpassFilter::design(double sampleRate) const
{
    const double nyq = BIOSIG_TRY(nyquist(sampleRate, kName));
    return designButterworth(_order, FilterBand::kHighpass, _cutoff / nyq);
}

Json::Value HighpassFilter::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["cutoff"] = _cutoff;
    j["order"] = _order;
    return j;
}

// ─── LowpassFilter ───────────────────────────────────────────────────────────

LowpassFilter::LowpassFilter(double cutoff, int order)
    : _cutoff(cutoff), _order(order)
{
}

core::Expected<SosCascade> LowpassFilter::design(double sampleRate) const
{
    const double nyq = BIOSIG_TRY(nyquist(sampleRate, kName));
    return designButterworth(_order, FilterBand::kLowpass, _cutoff / nyq);
}

Json::Value LowpassFilter::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["cutoff"] = _cutoff;
    j["order"] = _order;
    return j;
}

} // namespace biosig::dsp
