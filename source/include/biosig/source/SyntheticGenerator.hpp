/**
 * @file SyntheticGenerator.hpp
 * @brief Deterministic multichannel sinusoid-plus-noise generator.
 * @author MasterLaplace
 *
 * Fully deterministic for a given seed: the generator owns its random
 * engine, nothing is drawn from global state.
 *
 * @see SyntheticSource
 */

#pragma once

#include "biosig/dsp/SampleFrame.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace biosig::source {

/**
 * @brief One sinusoidal component.
 */
struct Oscillator {
    double frequencyHz = 10.0;
    double amplitude = 1.0;
    double phase = 0.0;
};

/**
 * @brief Per-channel oscillators plus additive Gaussian noise.
 *
 * A channel without an oscillator list gets a unit sinusoid at
 * 5 + 10 * channel Hz.
 */
struct SyntheticProfile {
    std::vector<std::vector<Oscillator>> channels;
    double noiseStd = 0.0;

    /**
     * @brief Same oscillator on every channel.
     */
    [[nodiscard]] static SyntheticProfile uniform(std::size_t channelCount, Oscillator oscillator, double noiseStd = 0.0);
};

/**
 * @code
 *   SyntheticGenerator gen(profile, 2, 1000.0, 42);
 *   dsp::SampleMatrix batch = gen.generate(256);   // 2 x 256
 * @endcode
 */
class SyntheticGenerator {
public:
    /**
     * @param seed Random seed (0 = time-based non-deterministic)
     */
    SyntheticGenerator(SyntheticProfile profile, std::size_t channelCount, double sampleRate, std::uint64_t seed);

    /**
     * @brief Produces the next @p count samples of every channel.
     */
    [[nodiscard]] dsp::SampleMatrix generate(std::size_t count);

    /**
     * @brief Rewinds to sample 0 and reseeds.
     */
    void reset(std::uint64_t seed);

    /**
     * @brief Total number of samples generated since construction or reset.
     */
    [[nodiscard]] std::uint64_t sampleIndex() const noexcept { return _sampleIndex; }

    [[nodiscard]] std::size_t channelCount() const noexcept { return _channelCount; }
    [[nodiscard]] double sampleRate() const noexcept { return _sampleRate; }

private:
    std::vector<std::vector<Oscillator>> _oscillators;
    double _noiseStd;
    std::size_t _channelCount;
    double _sampleRate;
    std::mt19937_64 _rng;
    std::normal_distribution<double> _noise{0.0, 1.0};
    std::uint64_t _sampleIndex = 0;
};

} // namespace biosig::source
