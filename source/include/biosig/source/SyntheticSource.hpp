/**
 * @file SyntheticSource.hpp
 * @brief Acquisition source backed by the SyntheticGenerator.
 * @author MasterLaplace
 *
 * In real-time mode read() only returns the samples that are due given
 * the wall-clock time elapsed since start(), emulating a device. In burst
 * mode every read() returns as many samples as requested.
 */

#pragma once

#include "biosig/source/ISource.hpp"
#include "biosig/source/SyntheticGenerator.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace biosig::source {

struct SyntheticSourceConfig {
    std::size_t channelCount = 2;
    double sampleRate = 1000.0;
    SyntheticProfile profile{};
    std::uint64_t seed = 42;
    bool realtime = false;

    /** @brief Stream length; reads return nothing afterwards. Unbounded when empty. */
    std::optional<double> durationSeconds;

    /** @brief Channel names; "ch{i}" for missing entries. */
    std::vector<std::string> channelLabels;
};

class SyntheticSource final : public ISource {
public:
    explicit SyntheticSource(SyntheticSourceConfig config);

    [[nodiscard]] core::ExpectedVoid start() override;
    [[nodiscard]] core::Expected<dsp::SampleFrame> read(std::size_t maxSamples) override;
    void stop() noexcept override;
    [[nodiscard]] SourceInfo info() const override;

    /**
     * @brief Samples emitted since start().
     */
    [[nodiscard]] std::uint64_t samplesEmitted() const noexcept { return _emitted; }

    /**
     * @brief True once a finite stream has delivered all of its samples.
     */
    [[nodiscard]] bool exhausted() const noexcept;

private:
    SyntheticSourceConfig _config;
    SyntheticGenerator _gen;
    std::optional<std::uint64_t> _totalSamples;

    bool _running = false;
    std::uint64_t _emitted = 0;
    double _startPosix = 0.0;
    std::chrono::steady_clock::time_point _startSteady{};
};

} // namespace biosig::source
