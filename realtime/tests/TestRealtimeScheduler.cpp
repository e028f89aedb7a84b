/**
 * @file TestRealtimeScheduler.cpp
 * @brief Unit tests for realtime::RealtimeScheduler.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "biosig/core/Log.hpp"
#include "biosig/dsp/ArtifactDetector.hpp"
#include "biosig/dsp/Filters.hpp"
#include "biosig/predict/CallbackPredictor.hpp"
#include "biosig/realtime/RealtimeScheduler.hpp"

#include <chrono>
#include <cmath>
#include <mutex>
#include <numbers>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace biosig::realtime {

using Catch::Matchers::WithinAbs;

namespace {

constexpr double kRate = 1000.0;

/// Passes frames through, fails on any sample beyond +/- 100.
class SpikeRejector final : public dsp::IOperator {
public:
    core::Expected<dsp::OperatorOutput> process(dsp::SampleFrame frame) const override
    {
        if (frame.samples.cwiseAbs().maxCoeff() > 100.0)
            return std::unexpected(core::Error::make(core::ErrorCode::kInvalidArgument, "spike in window"));
        return dsp::OperatorOutput{std::move(frame), {}};
    }
    core::Expected<double> validate(double sampleRate) const override { return sampleRate; }
    std::string_view name() const noexcept override { return "spike_rejector"; }
    Json::Value jsonize() const override
    {
        Json::Value out;
        out["name"] = "spike_rejector";
        return out;
    }
};

dsp::SampleMatrix tones(Eigen::Index count, Eigen::Index offset = 0)
{
    dsp::SampleMatrix m(2, count);
    for (Eigen::Index i = 0; i < count; ++i) {
        const double t = static_cast<double>(offset + i) / kRate;
        m(0, i) = std::sin(2.0 * std::numbers::pi * 10.0 * t);
        m(1, i) = 2.0 * std::sin(2.0 * std::numbers::pi * 20.0 * t);
    }
    return m;
}

dsp::Pipeline filters()
{
    auto pipeline = dsp::Pipeline::builder()
        .add<dsp::NotchFilter>(50.0, 30.0)
        .add<dsp::BandpassFilter>(1.0, 100.0, 4)
        .add<dsp::ArtifactDetector>()
        .build(kRate);
    REQUIRE(pipeline.has_value());
    return std::move(*pipeline);
}

core::Expected<predict::Prediction> loudestChannel(std::span<const double> values)
{
    const std::size_t perChannel = values.size() / 2;
    const double rms0 = values[2];
    const double rms1 = values[perChannel + 2];
    return predict::Prediction{rms0 >= rms1 ? "ch0" : "ch1", {rms0, rms1}};
}

/// Thread-safe record of what the sink received.
struct Collected {
    std::mutex mutex;
    std::vector<TickResult> results;

    ResultSink sink()
    {
        return [this](const TickResult &result) {
            std::lock_guard lock(mutex);
            results.push_back(result);
        };
    }

    std::size_t count()
    {
        std::lock_guard lock(mutex);
        return results.size();
    }
};

struct Fixture {
    std::shared_ptr<dsp::RingBuffer> ring = std::make_shared<dsp::RingBuffer>(2, 2000);
    std::shared_ptr<const feature::FeatureExtractor> extractor = std::make_shared<const feature::FeatureExtractor>();
    Collected collected;

    core::Expected<std::unique_ptr<RealtimeScheduler>> make(
        std::shared_ptr<predict::IPredictor> predictor,
        SchedulerConfig config = SchedulerConfig::Builder().warnOnOverrun(false).build(),
        dsp::Pipeline pipeline = filters())
    {
        return RealtimeScheduler::create(ring, std::move(pipeline), extractor, std::move(predictor),
                                         collected.sink(), config);
    }
};

/// Keeps messages written from the worker thread.
class RecordingLogger final : public core::ILogger {
public:
    void write(core::LogLevel, std::string_view tag, std::string_view message) override
    {
        std::lock_guard lock(_mutex);
        _lines.push_back(std::string(tag) + ": " + std::string(message));
    }

    bool contains(std::string_view text)
    {
        std::lock_guard lock(_mutex);
        for (const auto &line : _lines)
        {
            if (line.find(text) != std::string::npos)
                return true;
        }
        return false;
    }

private:
    std::mutex _mutex;
    std::vector<std::string> _lines;
};

template <typename Pred>
bool waitFor(Pred done, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace

TEST_CASE("create() rejects missing collaborators", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(loudestChannel);
    const auto config = SchedulerConfig::Builder().build();

    REQUIRE(RealtimeScheduler::create(nullptr, filters(), fx.extractor, predictor, fx.collected.sink(), config)
                .error().code == core::ErrorCode::kInvalidArgument);
    REQUIRE(RealtimeScheduler::create(fx.ring, filters(), nullptr, predictor, fx.collected.sink(), config)
                .error().code == core::ErrorCode::kInvalidArgument);
    REQUIRE(RealtimeScheduler::create(fx.ring, filters(), fx.extractor, nullptr, fx.collected.sink(), config)
                .error().code == core::ErrorCode::kInvalidArgument);
    REQUIRE(RealtimeScheduler::create(fx.ring, filters(), fx.extractor, predictor, ResultSink{}, config)
                .error().code == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("create() rejects inconsistent timing", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(loudestChannel);

    SECTION("non-positive step")
    {
        REQUIRE(fx.make(predictor, SchedulerConfig::Builder().stepSeconds(0.0).build())
                    .error().code == core::ErrorCode::kInvalidConfiguration);
    }
    SECTION("window larger than the ring")
    {
        REQUIRE(fx.make(predictor, SchedulerConfig::Builder().windowSeconds(3.0).build())
                    .error().code == core::ErrorCode::kInvalidConfiguration);
    }
    SECTION("window shorter than one sample")
    {
        REQUIRE(fx.make(predictor, SchedulerConfig::Builder().windowSeconds(0.0001).build())
                    .error().code == core::ErrorCode::kInvalidConfiguration);
    }
    SECTION("pipeline built for another rate")
    {
        REQUIRE(fx.make(predictor, SchedulerConfig::Builder().sampleRate(500.0).build())
                    .error().code == core::ErrorCode::kInvalidConfiguration);
    }
    SECTION("window too short for the filters")
    {
        const auto created = fx.make(predictor, SchedulerConfig::Builder().windowSeconds(0.02).build());
        REQUIRE_FALSE(created.has_value());
        REQUIRE(created.error().code == core::ErrorCode::kInvalidConfiguration);
        REQUIRE(created.error().message.find("pipeline rejects") != std::string::npos);
    }
}

TEST_CASE("Manual ticks wait for a full window, then predict", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(loudestChannel);
    auto scheduler = fx.make(predictor);
    REQUIRE(scheduler.has_value());
    auto &rt = **scheduler;
    REQUIRE(rt.windowSamples() == 200);
    REQUIRE(rt.pipeline().history().empty());

    REQUIRE(rt.tick() == TickOutcome::kInsufficientData);
    REQUIRE(fx.ring->push(tones(150)));
    REQUIRE(rt.tick() == TickOutcome::kInsufficientData);
    REQUIRE(fx.collected.count() == 0);

    REQUIRE(fx.ring->push(tones(150, 150)));
    REQUIRE(rt.tick() == TickOutcome::kCompleted);
    REQUIRE(fx.collected.count() == 1);

    const auto &result = fx.collected.results.front();
    REQUIRE(result.prediction.label == "ch1");
    REQUIRE(result.features.size() == 34);
    REQUIRE(result.features.keyAt(0) == "ch0_mean");
    REQUIRE_THAT(result.windowEndTimestamp, WithinAbs(0.299, 1e-12));
    REQUIRE(result.latencySeconds >= 0.0);
    REQUIRE(result.annotations.contains("artifact_detector"));

    const auto stats = rt.stats();
    REQUIRE(stats.idlePolls == 2);
    REQUIRE(stats.ticks == 1);
    REQUIRE(stats.completed == 1);
    REQUIRE(stats.coercedPredictions == 1);
    REQUIRE(stats.maxLatencySeconds >= stats.lastLatencySeconds);
    REQUIRE(rt.pipeline().history().size() == 3);
}

TEST_CASE("Pipeline history keeps every tick by default", "[realtime][scheduler]")
{
    Fixture fx;
    auto scheduler = fx.make(std::make_shared<predict::CallbackPredictor>(loudestChannel));
    REQUIRE(scheduler.has_value());
    auto &rt = **scheduler;
    REQUIRE(rt.pipeline().stageCount() == 3);
    REQUIRE(rt.pipeline().history().empty());

    REQUIRE(fx.ring->push(tones(300)));
    constexpr std::size_t kTicks = 40;
    for (std::size_t i = 0; i < kTicks; ++i)
        REQUIRE(rt.tick() == TickOutcome::kCompleted);

    const auto &history = rt.pipeline().history();
    REQUIRE(history.size() == kTicks * rt.pipeline().stageCount());
    REQUIRE(history.front().operatorName == "notch");
    REQUIRE(history.back().operatorName == "artifact_detector");
}

TEST_CASE("historyTicks bounds the pipeline history", "[realtime][scheduler]")
{
    Fixture fx;
    auto scheduler = fx.make(std::make_shared<predict::CallbackPredictor>(loudestChannel),
        SchedulerConfig::Builder().warnOnOverrun(false).historyTicks(2).build());
    REQUIRE(scheduler.has_value());
    auto &rt = **scheduler;

    REQUIRE(fx.ring->push(tones(300)));
    REQUIRE(rt.tick() == TickOutcome::kCompleted);
    REQUIRE(rt.pipeline().history().size() == rt.pipeline().stageCount());
    for (int i = 0; i < 4; ++i)
        REQUIRE(rt.tick() == TickOutcome::kCompleted);
    REQUIRE(rt.pipeline().history().size() == 2 * rt.pipeline().stageCount());
}

TEST_CASE("Keyed predictors are not coerced", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(
        loudestChannel,
        [](const feature::FeatureVector &features) -> core::Expected<predict::Prediction> {
            return predict::Prediction{*features.find("ch0_rms") > *features.find("ch1_rms") ? "ch0" : "ch1", {}};
        });
    auto scheduler = fx.make(predictor);
    REQUIRE(scheduler.has_value());

    REQUIRE(fx.ring->push(tones(400)));
    REQUIRE((*scheduler)->tick() == TickOutcome::kCompleted);
    REQUIRE((*scheduler)->stats().coercedPredictions == 0);
    REQUIRE(fx.collected.results.front().prediction.label == "ch1");
}

TEST_CASE("A failing pipeline skips the tick without stopping", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(loudestChannel);
    auto pipeline = dsp::Pipeline::builder().add<SpikeRejector>().build(kRate);
    REQUIRE(pipeline.has_value());
    auto scheduler = fx.make(predictor, SchedulerConfig::Builder().build(), std::move(*pipeline));
    REQUIRE(scheduler.has_value());

    dsp::SampleMatrix spiky = tones(300);
    spiky(1, 250) = 1.0e4;
    REQUIRE(fx.ring->push(spiky));
    REQUIRE((*scheduler)->tick() == TickOutcome::kPipelineFailed);
    REQUIRE((*scheduler)->stats().pipelineFailures == 1);
    REQUIRE(fx.collected.count() == 0);

    REQUIRE(fx.ring->push(tones(200, 300)));
    REQUIRE((*scheduler)->tick() == TickOutcome::kCompleted);
    REQUIRE(fx.collected.count() == 1);
}

TEST_CASE("A failing predictor is counted", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(
        [](std::span<const double>) -> core::Expected<predict::Prediction> {
            return std::unexpected(core::Error::make(core::ErrorCode::kPredictorFailure, "model crashed"));
        });
    auto scheduler = fx.make(predictor);
    REQUIRE(scheduler.has_value());

    REQUIRE(fx.ring->push(tones(300)));
    REQUIRE((*scheduler)->tick() == TickOutcome::kPredictorFailed);
    REQUIRE((*scheduler)->tick() == TickOutcome::kPredictorFailed);

    const auto stats = (*scheduler)->stats();
    REQUIRE(stats.predictorFailures == 2);
    REQUIRE(stats.completed == 0);
    REQUIRE(fx.collected.count() == 0);
}

TEST_CASE("Scheduler lifecycle", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(loudestChannel);
    auto scheduler = fx.make(predictor, SchedulerConfig::Builder().stepSeconds(0.02).warnOnOverrun(false).build());
    REQUIRE(scheduler.has_value());
    auto &rt = **scheduler;
    REQUIRE(rt.state() == SchedulerState::kIdle);

    REQUIRE(fx.ring->push(tones(400)));
    REQUIRE(rt.start());
    REQUIRE(rt.isRunning());
    REQUIRE(rt.start().error().code == core::ErrorCode::kAlreadyRunning);
    REQUIRE(rt.tick().error().code == core::ErrorCode::kInvalidState);
    REQUIRE(predictor->boundSchema().has_value());
    REQUIRE(predictor->boundSchema()->size() == 34);

    REQUIRE(waitFor([&] { return fx.collected.count() >= 3; }));

    rt.stop();
    REQUIRE(rt.state() == SchedulerState::kStopped);
    REQUIRE_FALSE(rt.isRunning());
    REQUIRE(rt.start().error().code == core::ErrorCode::kInvalidState);

    const auto delivered = fx.collected.count();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(fx.collected.count() == delivered);
    REQUIRE(rt.stats().completed == delivered);

    rt.stop();
    REQUIRE(rt.state() == SchedulerState::kStopped);
}

TEST_CASE("The worker logs its summary on the way out", "[realtime][scheduler]")
{
    RecordingLogger logger;
    core::Log::setLogger(&logger);

    Fixture fx;
    auto scheduler = fx.make(std::make_shared<predict::CallbackPredictor>(loudestChannel),
        SchedulerConfig::Builder().stepSeconds(0.02).warnOnOverrun(false).build());
    REQUIRE(scheduler.has_value());
    auto &rt = **scheduler;

    REQUIRE(fx.ring->push(tones(400)));
    REQUIRE(rt.start());
    REQUIRE(waitFor([&] { return fx.collected.count() >= 1; }));
    REQUIRE_FALSE(logger.contains("scheduler stopped after"));

    rt.stop();
    const bool logged = logger.contains("scheduler stopped after");
    core::Log::setLogger(nullptr);
    REQUIRE(logged);
}

TEST_CASE("Stopping an idle scheduler retires it", "[realtime][scheduler]")
{
    Fixture fx;
    auto scheduler = fx.make(std::make_shared<predict::CallbackPredictor>(loudestChannel));
    REQUIRE(scheduler.has_value());

    (*scheduler)->stop();
    REQUIRE((*scheduler)->state() == SchedulerState::kStopped);
    REQUIRE((*scheduler)->start().error().code == core::ErrorCode::kInvalidState);
}

TEST_CASE("The predictor may refuse the schema at start", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(
        loudestChannel, predict::CallbackPredictor::KeyedFn{},
        [](const feature::FeatureSchema &schema) -> core::ExpectedVoid {
            if (schema.size() != 17)
                return std::unexpected(core::Error::make(core::ErrorCode::kPredictorInput, "single-channel model"));
            return {};
        });
    auto scheduler = fx.make(predictor);
    REQUIRE(scheduler.has_value());

    const auto started = (*scheduler)->start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code == core::ErrorCode::kPredictorInput);
    REQUIRE((*scheduler)->state() == SchedulerState::kIdle);
}

TEST_CASE("Slow predictions are counted as overruns", "[realtime][scheduler]")
{
    Fixture fx;
    auto predictor = std::make_shared<predict::CallbackPredictor>(
        [](std::span<const double> values) -> core::Expected<predict::Prediction> {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            return loudestChannel(values);
        });
    auto scheduler = fx.make(predictor, SchedulerConfig::Builder().stepSeconds(0.01).warnOnOverrun(false).build());
    REQUIRE(scheduler.has_value());

    REQUIRE(fx.ring->push(tones(400)));
    REQUIRE((*scheduler)->start());
    REQUIRE(waitFor([&] { return (*scheduler)->stats().overruns >= 2; }));
    (*scheduler)->stop();

    const auto stats = (*scheduler)->stats();
    REQUIRE(stats.maxLatencySeconds >= 0.03);
    REQUIRE(tickOutcomeName(TickOutcome::kCompleted) == "Completed");
    REQUIRE(schedulerStateName(SchedulerState::kStopped) == "Stopped");
}

} // namespace biosig::realtime
