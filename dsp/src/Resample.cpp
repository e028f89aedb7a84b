/**
 * @file Resample.cpp
 * @brief FFT based resampling using Eigen's FFT module.
 * @author MasterLaplace
 */

#include "biosig/dsp/Resample.hpp"

#include <unsupported/Eigen/FFT>

#include <cmath>
#include <complex>
#include <format>

namespace biosig::dsp {

std::vector<double> fourierResample(std::span<const double> input, std::size_t outputCount)
{
    const std::size_t nx = input.size();
    if (nx == 0 || outputCount == 0)
        return std::vector<double>(outputCount, 0.0);

    Eigen::FFT<double> fft;
    std::vector<double> timeIn(input.begin(), input.end());
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, timeIn);

    // Half spectrum of the output: the first min(num, nx) / 2 + 1 bins of the input.
    const std::size_t n = std::min(outputCount, nx);
    const std::size_t keep = n / 2 + 1;
    std::vector<std::complex<double>> half(outputCount / 2 + 1, {0.0, 0.0});
    for (std::size_t k = 0; k < keep && k < half.size(); ++k)
        half[k] = spectrum[k];

    // An even-length band edge is shared by both halves of the spectrum.
    if (n % 2 == 0) {
        if (outputCount < nx)
            half[n / 2] *= 2.0;
        else if (outputCount > nx)
            half[n / 2] *= 0.5;
    }

    std::vector<std::complex<double>> full(outputCount, {0.0, 0.0});
    full[0] = {half[0].real(), 0.0};
    for (std::size_t k = 1; k < half.size(); ++k) {
        full[k] = half[k];
        full[outputCount - k] = std::conj(half[k]);
    }
    if (outputCount % 2 == 0)
        full[outputCount / 2] = {half[outputCount / 2].real(), 0.0};

    std::vector<std::complex<double>> timeOut;
    fft.inv(timeOut, full);

    const double scale = static_cast<double>(outputCount) / static_cast<double>(nx);
    std::vector<double> out(outputCount);
    for (std::size_t i = 0; i < outputCount; ++i)
        out[i] = timeOut[i].real() * scale;
    return out;
}

Resample::Resample(double targetRate)
    : _targetRate(targetRate)
{
}

core::Expected<double> Resample::validate(double sampleRate) const
{
    if (!(_targetRate > 0.0) || !(sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("resample: rates must be > 0 (input {}, target {})", sampleRate, _targetRate)));
    }
    return _targetRate;
}

core::Expected<OperatorOutput> Resample::process(SampleFrame frame) const
{
    if (auto rate = validate(frame.sampleRate); !rate)
        return std::unexpected(std::move(rate.error()));

    if (frame.sampleRate == _targetRate)
        return OperatorOutput{std::move(frame), {}};

    const auto n = frame.sampleCount();
    const auto num = static_cast<std::size_t>(
        std::llround(static_cast<double>(n) * _targetRate / frame.sampleRate));
    if (n > 0 && num == 0) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("resample: {} samples at {} Hz leave nothing at {} Hz", n, frame.sampleRate, _targetRate)));
    }

    SampleFrame out;
    out.sampleRate = _targetRate;
    out.samples.resize(frame.samples.rows(), static_cast<Eigen::Index>(num));
    for (Eigen::Index ch = 0; ch < frame.samples.rows(); ++ch) {
        const auto resampled = fourierResample(channelView(frame.samples, ch), num);
        std::copy(resampled.begin(), resampled.end(), channelView(out.samples, ch).begin());
    }

    const double start = frame.timestamps.empty() ? 0.0 : frame.timestamps.front();
    out.timestamps.resize(num);
    for (std::size_t i = 0; i < num; ++i)
        out.timestamps[i] = start + static_cast<double>(i) / _targetRate;

    return OperatorOutput{std::move(out), {}};
}

Json::Value Resample::jsonize() const
{
    Json::Value j;
    j["name"] = std::string(kName);
    j["target_fs"] = _targetRate;
    return j;
}

} // namespace biosig::dsp
