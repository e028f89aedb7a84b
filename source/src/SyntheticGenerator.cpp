/**
 * @file SyntheticGenerator.cpp
 * @brief Implementation of the deterministic signal generator.
 * @author MasterLaplace
 */

#include "biosig/source/SyntheticGenerator.hpp"

#include <chrono>
#include <cmath>
#include <numbers>

namespace biosig::source {

namespace {

std::uint64_t resolveSeed(std::uint64_t seed)
{
    if (seed == 0) {
        seed = static_cast<std::uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }
    return seed;
}

} // anonymous namespace

SyntheticProfile SyntheticProfile::uniform(std::size_t channelCount, Oscillator oscillator, double noiseStd)
{
    SyntheticProfile profile;
    profile.channels.assign(channelCount, std::vector<Oscillator>{oscillator});
    profile.noiseStd = noiseStd;
    return profile;
}

SyntheticGenerator::SyntheticGenerator(
    SyntheticProfile profile, std::size_t channelCount, double sampleRate, std::uint64_t seed)
    : _oscillators(std::move(profile.channels))
    , _noiseStd(profile.noiseStd)
    , _channelCount(channelCount)
    , _sampleRate(sampleRate)
    , _rng(resolveSeed(seed))
{
    _oscillators.resize(_channelCount);
    for (std::size_t ch = 0; ch < _channelCount; ++ch) {
        if (_oscillators[ch].empty())
            _oscillators[ch].push_back(Oscillator{5.0 + 10.0 * static_cast<double>(ch), 1.0, 0.0});
    }
}

dsp::SampleMatrix SyntheticGenerator::generate(std::size_t count)
{
    dsp::SampleMatrix out(static_cast<Eigen::Index>(_channelCount), static_cast<Eigen::Index>(count));

    for (std::size_t t = 0; t < count; ++t) {
        const double timeSec = static_cast<double>(_sampleIndex) / _sampleRate;

        for (std::size_t ch = 0; ch < _channelCount; ++ch) {
            double value = 0.0;
            for (const auto &osc : _oscillators[ch]) {
                value += osc.amplitude * std::sin(
                    2.0 * std::numbers::pi * osc.frequencyHz * timeSec + osc.phase);
            }
            if (_noiseStd > 0.0)
                value += _noiseStd * _noise(_rng);

            out(static_cast<Eigen::Index>(ch), static_cast<Eigen::Index>(t)) = value;
        }
        ++_sampleIndex;
    }
    return out;
}

void SyntheticGenerator::reset(std::uint64_t seed)
{
    _rng.seed(resolveSeed(seed));
    _noise.reset();
    _sampleIndex = 0;
}

} // namespace biosig::source
