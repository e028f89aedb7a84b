/**
 * @file SyntheticSource.cpp
 * @brief Implementation of the synthetic acquisition source.
 * @author MasterLaplace
 */

#include "biosig/source/SyntheticSource.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace biosig::source {

namespace {

double posixNow()
{
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

SyntheticSource::SyntheticSource(SyntheticSourceConfig config)
    : _config(std::move(config))
    , _gen(_config.profile, _config.channelCount, _config.sampleRate, _config.seed)
{
    if (_config.durationSeconds) {
        _totalSamples = static_cast<std::uint64_t>(
            std::max(0.0, std::round(*_config.durationSeconds * _config.sampleRate)));
    }
    _config.channelLabels.resize(_config.channelCount);
    for (std::size_t ch = 0; ch < _config.channelCount; ++ch) {
        if (_config.channelLabels[ch].empty())
            _config.channelLabels[ch] = std::format("ch{}", ch);
    }
}

core::ExpectedVoid SyntheticSource::start()
{
    if (_running) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kAlreadyRunning, "SyntheticSource already running"));
    }
    if (_config.channelCount == 0 || !(_config.sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("SyntheticSource needs channels > 0 and a positive rate (got {}, {})",
                _config.channelCount, _config.sampleRate)));
    }

    _gen.reset(_config.seed);
    _emitted = 0;
    _startPosix = posixNow();
    _startSteady = std::chrono::steady_clock::now();
    _running = true;
    return {};
}

core::Expected<dsp::SampleFrame> SyntheticSource::read(std::size_t maxSamples)
{
    if (!_running) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kNotInitialized, "SyntheticSource not started"));
    }

    std::uint64_t count = maxSamples;
    if (_config.realtime) {
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - _startSteady).count();
        const auto due = static_cast<std::uint64_t>(elapsed * _config.sampleRate);
        count = std::min<std::uint64_t>(count, due > _emitted ? due - _emitted : 0);
    }
    if (_totalSamples)
        count = std::min<std::uint64_t>(count, *_totalSamples > _emitted ? *_totalSamples - _emitted : 0);

    dsp::SampleFrame frame;
    frame.sampleRate = _config.sampleRate;
    frame.samples = _gen.generate(static_cast<std::size_t>(count));
    frame.timestamps.resize(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < frame.timestamps.size(); ++i)
        frame.timestamps[i] = _startPosix + static_cast<double>(_emitted + i) / _config.sampleRate;

    _emitted += count;
    return frame;
}

void SyntheticSource::stop() noexcept
{
    _running = false;
}

SourceInfo SyntheticSource::info() const
{
    return SourceInfo{
        .name = "Synthetic",
        .channelLabels = _config.channelLabels,
        .sampleRate = _config.sampleRate
    };
}

bool SyntheticSource::exhausted() const noexcept
{
    return _totalSamples && _emitted >= *_totalSamples;
}

} // namespace biosig::source
