/**
 * @file RealtimeScheduler.cpp
 * @brief RealtimeScheduler implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <biosig/realtime/RealtimeScheduler.hpp>
#include <biosig/core/Interruptible.hpp>
#include <biosig/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>

namespace biosig::realtime {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kTag = "realtime";

[[nodiscard]] core::Error configError(std::string message)
{
    return core::Error::make(core::ErrorCode::kInvalidConfiguration, std::move(message));
}

} // namespace

std::string_view schedulerStateName(SchedulerState state) noexcept
{
    switch (state)
    {
        case SchedulerState::kIdle:     return "Idle";
        case SchedulerState::kRunning:  return "Running";
        case SchedulerState::kStopping: return "Stopping";
        case SchedulerState::kStopped:  return "Stopped";
    }
    return "Unknown";
}

std::string_view tickOutcomeName(TickOutcome outcome) noexcept
{
    switch (outcome)
    {
        case TickOutcome::kCompleted:        return "Completed";
        case TickOutcome::kInsufficientData: return "InsufficientData";
        case TickOutcome::kPipelineFailed:   return "PipelineFailed";
        case TickOutcome::kPredictorFailed:  return "PredictorFailed";
    }
    return "Unknown";
}

// ========================================================================== //
//  Construction                                                              //
// ========================================================================== //

core::Expected<std::unique_ptr<RealtimeScheduler>> RealtimeScheduler::create(
    std::shared_ptr<dsp::RingBuffer> ring,
    dsp::Pipeline pipeline,
    std::shared_ptr<const feature::FeatureExtractor> extractor,
    std::shared_ptr<predict::IPredictor> predictor,
    ResultSink sink,
    const SchedulerConfig& config)
{
    if (!ring || !extractor || !predictor || !sink)
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kInvalidArgument,
            "scheduler requires a ring, an extractor, a predictor and a sink"));
    }

    if (!(config.windowSeconds() > 0.0) || !(config.stepSeconds() > 0.0) || !(config.sampleRate() > 0.0))
    {
        return std::unexpected(configError(std::format(
            "window ({} s), step ({} s) and sample rate ({} Hz) must be positive",
            config.windowSeconds(), config.stepSeconds(), config.sampleRate())));
    }

    const auto windowSamples = static_cast<core::usize>(std::llround(config.windowSeconds() * config.sampleRate()));
    if (windowSamples == 0)
    {
        return std::unexpected(configError(std::format(
            "window of {} s is shorter than one sample at {} Hz", config.windowSeconds(), config.sampleRate())));
    }
    if (windowSamples > ring->capacity())
    {
        return std::unexpected(configError(std::format(
            "window of {} samples exceeds ring capacity {}", windowSamples, ring->capacity())));
    }
    if (pipeline.inputRate() != config.sampleRate())
    {
        return std::unexpected(configError(std::format(
            "pipeline expects {} Hz, scheduler is configured for {} Hz",
            pipeline.inputRate(), config.sampleRate())));
    }

    dsp::SampleFrame silence;
    silence.samples = dsp::SampleMatrix::Zero(static_cast<Eigen::Index>(ring->channelCount()),
                                              static_cast<Eigen::Index>(windowSamples));
    silence.timestamps.resize(windowSamples);
    for (core::usize i = 0; i < windowSamples; ++i)
        silence.timestamps[i] = static_cast<double>(i) / config.sampleRate();
    silence.sampleRate = config.sampleRate();

    auto checked = pipeline.dryRun(std::move(silence));
    if (!checked)
    {
        return std::unexpected(configError(std::format(
            "pipeline rejects a {}-sample window: {}", windowSamples, checked.error().message)));
    }
    if (auto features = extractor->extract(checked->frame.samples, checked->frame.sampleRate); !features)
    {
        return std::unexpected(configError(std::format(
            "feature extraction rejects the processed window: {}", features.error().message)));
    }

    if (config.historyTicks() != 0)
        pipeline.setHistoryLimit(pipeline.stageCount() * config.historyTicks());

    return std::unique_ptr<RealtimeScheduler>(new RealtimeScheduler(
        std::move(ring), std::move(pipeline), std::move(extractor), std::move(predictor),
        std::move(sink), config, windowSamples));
}

RealtimeScheduler::RealtimeScheduler(std::shared_ptr<dsp::RingBuffer> ring,
                                     dsp::Pipeline pipeline,
                                     std::shared_ptr<const feature::FeatureExtractor> extractor,
                                     std::shared_ptr<predict::IPredictor> predictor,
                                     ResultSink sink,
                                     const SchedulerConfig& config,
                                     core::usize windowSamples)
    : _ring(std::move(ring))
    , _pipeline(std::move(pipeline))
    , _extractor(std::move(extractor))
    , _predictor(std::move(predictor))
    , _sink(std::move(sink))
    , _config(config)
    , _windowSamples(windowSamples)
{
}

RealtimeScheduler::~RealtimeScheduler()
{
    stop();
}

// ========================================================================== //
//  Lifecycle                                                                 //
// ========================================================================== //

core::ExpectedVoid RealtimeScheduler::start()
{
    const SchedulerState current = _state.load();
    if (current == SchedulerState::kRunning)
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kAlreadyRunning,
            "scheduler already running"));
    }
    if (current != SchedulerState::kIdle)
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kInvalidState,
            std::format("cannot start a scheduler in state {}", schedulerStateName(current))));
    }

    const auto schema = _extractor->schema(_ring->channelCount());
    BIOSIG_TRY_VOID(_predictor->bindSchema(*schema));

    _state.store(SchedulerState::kRunning);
    _worker = std::jthread([this](std::stop_token st) { run(st); });

    core::Log::info(kTag, std::format("scheduler started: window {} samples, step {} s, {} features",
        _windowSamples, _config.stepSeconds(), schema->size()));
    return {};
}

void RealtimeScheduler::stop() noexcept
{
    SchedulerState expected = SchedulerState::kRunning;
    if (_state.compare_exchange_strong(expected, SchedulerState::kStopping))
    {
        _worker.request_stop();
        if (_worker.joinable())
            _worker.join();
    }
    _state.store(SchedulerState::kStopped);
}

SchedulerStats RealtimeScheduler::stats() const
{
    std::lock_guard lock(_statsMutex);
    return _stats;
}

// ========================================================================== //
//  Iteration                                                                 //
// ========================================================================== //

core::Expected<TickOutcome> RealtimeScheduler::tick()
{
    const SchedulerState current = _state.load();
    if (current == SchedulerState::kRunning || current == SchedulerState::kStopping)
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kInvalidState,
            "tick() cannot be called while the worker thread runs"));
    }
    return step();
}

void RealtimeScheduler::run(std::stop_token stopToken)
{
    const auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(_config.stepSeconds()));

    while (!stopToken.stop_requested())
    {
        const auto started = Clock::now();

        if (step() == TickOutcome::kInsufficientData)
        {
            core::interruptibleSleep(stopToken, _config.idleBackoff());
            continue;
        }

        const auto remaining = period - (Clock::now() - started);
        if (remaining > Clock::duration::zero())
        {
            core::interruptibleSleep(stopToken, remaining);
            continue;
        }

        {
            std::lock_guard lock(_statsMutex);
            ++_stats.overruns;
        }
        if (_config.warnOnOverrun())
        {
            core::Log::warn(kTag, std::format("tick overran its {} s step by {:.3f} ms",
                _config.stepSeconds(),
                std::chrono::duration<double, std::milli>(-remaining).count()));
        }
    }

    const SchedulerStats snapshot = stats();
    core::Log::info(kTag, std::format("scheduler stopped after {} ticks ({} completed, {} overruns)",
        snapshot.ticks, snapshot.completed, snapshot.overruns));
}

TickOutcome RealtimeScheduler::step()
{
    const auto started = Clock::now();

    auto snapshot = _ring->readLast(_windowSamples);
    if (!snapshot)
    {
        std::lock_guard lock(_statsMutex);
        ++_stats.idlePolls;
        return TickOutcome::kInsufficientData;
    }

    {
        std::lock_guard lock(_statsMutex);
        ++_stats.ticks;
    }

    const double fs = _config.sampleRate();
    dsp::SampleFrame frame;
    frame.samples = std::move(snapshot->samples);
    frame.timestamps.resize(_windowSamples);
    for (core::usize i = 0; i < _windowSamples; ++i)
        frame.timestamps[i] = static_cast<double>(snapshot->startIndex + i) / fs;
    frame.sampleRate = fs;
    const double windowEnd = frame.timestamps.back();

    auto processed = _pipeline.run(std::move(frame));
    if (!processed)
    {
        core::Log::error(kTag, std::format("pipeline failed: {}", processed.error().format()));
        std::lock_guard lock(_statsMutex);
        ++_stats.pipelineFailures;
        return TickOutcome::kPipelineFailed;
    }

    auto features = _extractor->extract(processed->frame.samples, processed->frame.sampleRate);
    if (!features)
    {
        core::Log::error(kTag, std::format("feature extraction failed: {}", features.error().format()));
        std::lock_guard lock(_statsMutex);
        ++_stats.pipelineFailures;
        return TickOutcome::kPipelineFailed;
    }

    auto prediction = _predictor->predict(*features);
    bool coerced = false;
    if (!prediction && prediction.error().code == core::ErrorCode::kPredictorInput)
    {
        core::Log::debug(kTag, "predictor refused keyed features, retrying with flat values");
        coerced = true;
        prediction = _predictor->predict(features->values());
    }
    if (!prediction)
    {
        core::Log::error(kTag, std::format("prediction failed: {}", prediction.error().format()));
        std::lock_guard lock(_statsMutex);
        ++_stats.predictorFailures;
        return TickOutcome::kPredictorFailed;
    }

    const double latency = std::chrono::duration<double>(Clock::now() - started).count();
    {
        std::lock_guard lock(_statsMutex);
        ++_stats.completed;
        if (coerced)
            ++_stats.coercedPredictions;
        _stats.lastLatencySeconds = latency;
        _stats.maxLatencySeconds = std::max(_stats.maxLatencySeconds, latency);
    }

    _sink(TickResult{std::move(*prediction), latency, windowEnd, std::move(*features),
                     std::move(processed->annotations)});
    return TickOutcome::kCompleted;
}

} // namespace biosig::realtime
