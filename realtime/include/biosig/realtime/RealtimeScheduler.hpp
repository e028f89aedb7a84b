/**
 * @file RealtimeScheduler.hpp
 * @brief Fixed-step consumer loop: ring window -> pipeline -> features -> predictor.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BIOSIG_REALTIME_REALTIMESCHEDULER_HPP
    #define BIOSIG_REALTIME_REALTIMESCHEDULER_HPP

#include <biosig/core/Expected.hpp>
#include <biosig/core/NonCopyable.hpp>
#include <biosig/core/Types.hpp>
#include <biosig/dsp/Pipeline.hpp>
#include <biosig/dsp/RingBuffer.hpp>
#include <biosig/feature/FeatureExtractor.hpp>
#include <biosig/predict/IPredictor.hpp>
#include <biosig/realtime/SchedulerConfig.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace biosig::realtime {

enum class SchedulerState : core::u8
{
    kIdle,
    kRunning,
    kStopping,
    kStopped
};

[[nodiscard]] std::string_view schedulerStateName(SchedulerState state) noexcept;

/** @brief What a single iteration did. */
enum class TickOutcome : core::u8
{
    kCompleted,
    kInsufficientData,
    kPipelineFailed,
    kPredictorFailed
};

[[nodiscard]] std::string_view tickOutcomeName(TickOutcome outcome) noexcept;

/** @brief Delivered to the result sink once per completed tick. */
struct TickResult
{
    predict::Prediction prediction;

    /** @brief Wall time from window read to prediction, in seconds. */
    core::f64 latencySeconds{0.0};

    /** @brief Stream time of the newest sample in the window, in seconds. */
    core::f64 windowEndTimestamp{0.0};

    feature::FeatureVector features;
    std::map<std::string, dsp::Annotation> annotations;
};

using ResultSink = std::function<void(const TickResult&)>;

/** @brief Counters since construction. */
struct SchedulerStats
{
    core::u64 ticks{0};
    core::u64 completed{0};
    core::u64 idlePolls{0};
    core::u64 overruns{0};
    core::u64 predictorFailures{0};
    core::u64 pipelineFailures{0};
    core::u64 coercedPredictions{0};
    core::f64 lastLatencySeconds{0.0};
    core::f64 maxLatencySeconds{0.0};
};

/**
 * @brief Consumer side of the acquisition ring.
 *
 * Every step the scheduler snapshots the newest window from the ring,
 * runs it through the pipeline, extracts features and hands them to the
 * predictor. The pipeline, extractor and predictor are used by the worker
 * thread only; the ring is the one resource shared with producers.
 *
 * The sink and the predictor run on the worker thread and must not throw.
 */
class RealtimeScheduler final : private core::NonCopyable<RealtimeScheduler>
{
public:
    /**
     * @brief Validates the wiring and returns an Idle scheduler.
     *
     * The pipeline is run once on a silent window so that a window too
     * short for its filters is reported here rather than on every tick.
     *
     * @return kInvalidConfiguration on a bad config, a rate mismatch, a
     *         window larger than the ring, or a pipeline that rejects the
     *         window; kInvalidArgument on a null collaborator
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<RealtimeScheduler>> create(
        std::shared_ptr<dsp::RingBuffer> ring,
        dsp::Pipeline pipeline,
        std::shared_ptr<const feature::FeatureExtractor> extractor,
        std::shared_ptr<predict::IPredictor> predictor,
        ResultSink sink,
        const SchedulerConfig& config);

    ~RealtimeScheduler();

    /**
     * @brief Binds the feature schema to the predictor and starts the worker.
     *
     * @return kAlreadyRunning if running, kInvalidState once stopped, or
     *         the predictor's schema rejection
     */
    [[nodiscard]] core::ExpectedVoid start();

    /**
     * @brief Requests cancellation and joins the worker. Final.
     *
     * The worker logs the run summary as it exits, before the join returns.
     */
    void stop() noexcept;

    /**
     * @brief Performs one iteration's work on the calling thread.
     *
     * @return kInvalidState while the worker thread is running
     */
    [[nodiscard]] core::Expected<TickOutcome> tick();

    [[nodiscard]] SchedulerState state() const noexcept { return _state.load(); }
    [[nodiscard]] bool isRunning() const noexcept { return state() == SchedulerState::kRunning; }
    [[nodiscard]] SchedulerStats stats() const;

    [[nodiscard]] core::usize windowSamples() const noexcept { return _windowSamples; }
    [[nodiscard]] const SchedulerConfig& config() const noexcept { return _config; }
    [[nodiscard]] const dsp::Pipeline& pipeline() const noexcept { return _pipeline; }

private:
    RealtimeScheduler(std::shared_ptr<dsp::RingBuffer> ring,
                      dsp::Pipeline pipeline,
                      std::shared_ptr<const feature::FeatureExtractor> extractor,
                      std::shared_ptr<predict::IPredictor> predictor,
                      ResultSink sink,
                      const SchedulerConfig& config,
                      core::usize windowSamples);

    void run(std::stop_token stopToken);
    TickOutcome step();

    std::shared_ptr<dsp::RingBuffer> _ring;
    dsp::Pipeline _pipeline;
    std::shared_ptr<const feature::FeatureExtractor> _extractor;
    std::shared_ptr<predict::IPredictor> _predictor;
    ResultSink _sink;
    SchedulerConfig _config;
    core::usize _windowSamples;

    std::atomic<SchedulerState> _state{SchedulerState::kIdle};
    std::jthread _worker;

    mutable std::mutex _statsMutex;
    SchedulerStats _stats;
};

} // namespace biosig::realtime

#endif // BIOSIG_REALTIME_REALTIMESCHEDULER_HPP
