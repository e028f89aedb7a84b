/**
 * @file AcquisitionPump.cpp
 * @brief Implementation of the source-to-ring producer thread.
 * @author MasterLaplace
 */

#include "biosig/source/AcquisitionPump.hpp"

#include "biosig/core/Interruptible.hpp"
#include "biosig/core/Log.hpp"

#include <format>

namespace biosig::source {

AcquisitionPump::AcquisitionPump(ISource &source, dsp::RingBuffer &ring, PumpConfig config)
    : _source(source), _ring(ring), _config(config)
{
}

AcquisitionPump::~AcquisitionPump()
{
    stop();
}

core::ExpectedVoid AcquisitionPump::start()
{
    if (_running.load()) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kAlreadyRunning, "AcquisitionPump already running"));
    }
    // A worker that ended on an error still holds the source.
    stop();

    BIOSIG_TRY_VOID(_source.start());

    const auto info = _source.info();
    if (info.channelCount() != _ring.channelCount()) {
        _source.stop();
        return std::unexpected(core::Error::make(
            core::ErrorCode::kChannelCountMismatch,
            std::format("source '{}' has {} channels, ring expects {}",
                info.name, info.channelCount(), _ring.channelCount())));
    }

    {
        std::lock_guard lock(_errorMutex);
        _lastError.reset();
    }
    _sourceActive = true;
    _running.store(true);
    _worker = std::jthread([this](std::stop_token st) { workerLoop(st); });

    core::Log::info("source", std::format("pump started: '{}' {} ch @ {} Hz",
        info.name, info.channelCount(), info.sampleRate));
    return {};
}

void AcquisitionPump::stop() noexcept
{
    if (_worker.joinable()) {
        _worker.request_stop();
        _worker.join();
    }
    _running.store(false);
    if (_sourceActive) {
        _source.stop();
        _sourceActive = false;
    }
}

std::optional<core::Error> AcquisitionPump::lastError() const
{
    std::lock_guard lock(_errorMutex);
    return _lastError;
}

void AcquisitionPump::fail(core::Error error)
{
    core::Log::error("source", std::format("pump stopped: {}", error.format()));
    {
        std::lock_guard lock(_errorMutex);
        _lastError = std::move(error);
    }
    _running.store(false);
}

void AcquisitionPump::workerLoop(std::stop_token stopToken)
{
    while (!stopToken.stop_requested()) {
        auto frame = _source.read(_config.chunkSamples);
        if (!frame) {
            fail(std::move(frame.error()));
            return;
        }

        if (frame->empty()) {
            _emptyReads.fetch_add(1);
            core::interruptibleSleep(stopToken, _config.idleBackoff);
            continue;
        }

        if (auto pushed = _ring.push(frame->samples); !pushed) {
            fail(std::move(pushed.error()));
            return;
        }
        _samplesPumped.fetch_add(frame->sampleCount());

        core::interruptibleSleep(stopToken, _config.pollInterval);
    }
}

} // namespace biosig::source
