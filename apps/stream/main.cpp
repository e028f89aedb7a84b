// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief biosig_stream entry-point.
///
/// Streams a synthetic multichannel signal through the acquisition pump,
/// the preprocessing pipeline and the real-time scheduler, and logs one
/// prediction per step. The demo predictor labels each window with the
/// channel of highest RMS.
// /////////////////////////////////////////////////////////////////////////////

#include <biosig/core/Log.hpp>
#include <biosig/core/Types.hpp>
#include <biosig/dsp/ArtifactDetector.hpp>
#include <biosig/dsp/Filters.hpp>
#include <biosig/dsp/Pipeline.hpp>
#include <biosig/dsp/PipelineIo.hpp>
#include <biosig/dsp/RingBuffer.hpp>
#include <biosig/feature/FeatureExtractor.hpp>
#include <biosig/predict/CallbackPredictor.hpp>
#include <biosig/realtime/RealtimeScheduler.hpp>
#include <biosig/realtime/SchedulerConfig.hpp>
#include <biosig/source/AcquisitionPump.hpp>
#include <biosig/source/SyntheticSource.hpp>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cmath>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace biosig;

namespace {

struct Args
{
    std::string pipelinePath;
    std::string savePipelinePath;
    double durationSeconds{5.0};
    core::usize channels{2};
    double sampleRate{1000.0};
    double windowSeconds{0.2};
    double stepSeconds{0.1};
    core::u64 seed{42};
    bool help{false};
};

std::atomic<bool> gInterrupted{false};

void onSignal(int /*signal*/)
{
    gInterrupted.store(true);
}

void printHelp()
{
    std::printf(
        "biosig_stream (synthetic real-time biosignal demo)\n\n"
        "Usage:\n"
        "  biosig_stream [options]\n\n"
        "Options:\n"
        "  --pipeline PATH       Load the preprocessing pipeline from JSON\n"
        "                        (default: notch 50 Hz, bandpass 1-100 Hz, artifact detector)\n"
        "  --save-pipeline PATH  Write the pipeline configuration to JSON and continue\n"
        "  --duration S          Run time in seconds (default: 5)\n"
        "  --channels N          Channel count (default: 2)\n"
        "  --rate HZ             Sampling rate (default: 1000)\n"
        "  --window S            Analysis window in seconds (default: 0.2)\n"
        "  --step S              Step between predictions in seconds (default: 0.1)\n"
        "  --seed N              Noise seed (default: 42)\n"
        "  -h, --help            Show this help\n");
}

template <typename T>
core::Expected<T> parseNumber(std::string_view flag, std::string_view text)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kInvalidArgument,
            std::format("{} expects a number, got '{}'", flag, text)));
    }
    return value;
}

core::Expected<Args> parseArgs(int argc, char* argv[])
{
    Args args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            args.help = true;
            continue;
        }
        if (i + 1 >= argc)
        {
            return std::unexpected(core::Error::make(core::ErrorCode::kInvalidArgument,
                std::format("unknown option or missing value: {}", arg)));
        }

        const std::string_view value = argv[++i];
        if (arg == "--pipeline")
            args.pipelinePath = value;
        else if (arg == "--save-pipeline")
            args.savePipelinePath = value;
        else if (arg == "--duration")
            args.durationSeconds = BIOSIG_TRY(parseNumber<double>(arg, value));
        else if (arg == "--channels")
            args.channels = BIOSIG_TRY(parseNumber<core::usize>(arg, value));
        else if (arg == "--rate")
            args.sampleRate = BIOSIG_TRY(parseNumber<double>(arg, value));
        else if (arg == "--window")
            args.windowSeconds = BIOSIG_TRY(parseNumber<double>(arg, value));
        else if (arg == "--step")
            args.stepSeconds = BIOSIG_TRY(parseNumber<double>(arg, value));
        else if (arg == "--seed")
            args.seed = BIOSIG_TRY(parseNumber<core::u64>(arg, value));
        else
        {
            return std::unexpected(core::Error::make(core::ErrorCode::kInvalidArgument,
                std::format("unknown option: {}", arg)));
        }
    }

    if (args.channels == 0 || !(args.sampleRate > 0.0) || !(args.durationSeconds > 0.0))
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kInvalidArgument,
            "--channels, --rate and --duration must be positive"));
    }
    return args;
}

core::Expected<dsp::Pipeline> makePipeline(const Args& args)
{
    if (!args.pipelinePath.empty())
        return dsp::loadPipeline(args.pipelinePath, args.sampleRate);

    const double high = std::min(100.0, 0.45 * args.sampleRate);
    return dsp::Pipeline::builder()
        .add<dsp::NotchFilter>(50.0, 30.0)
        .add<dsp::BandpassFilter>(1.0, high, 4)
        .add<dsp::ArtifactDetector>()
        .build(args.sampleRate);
}

/// Channel i carries a (1 + i) amplitude tone at 10 + 5 i Hz on top of
/// 50 Hz mains interference, so the loudest channel is the last one.
source::SyntheticProfile makeProfile(core::usize channels)
{
    source::SyntheticProfile profile;
    profile.noiseStd = 0.1;
    for (core::usize ch = 0; ch < channels; ++ch)
    {
        const double index = static_cast<double>(ch);
        profile.channels.push_back({
            source::Oscillator{10.0 + 5.0 * index, 1.0 + index, 0.0},
            source::Oscillator{50.0, 0.5, 0.0},
        });
    }
    return profile;
}

/// Argmax of the per-channel RMS, located through the bound schema.
std::shared_ptr<predict::IPredictor> makePredictor(core::usize channels)
{
    auto rmsIndices = std::make_shared<std::vector<core::usize>>();

    auto onBind = [rmsIndices, channels](const feature::FeatureSchema& schema) -> core::ExpectedVoid {
        rmsIndices->clear();
        for (core::usize ch = 0; ch < channels; ++ch)
        {
            const auto index = schema.indexOf(std::format("ch{}_rms", ch));
            if (!index)
            {
                return std::unexpected(core::Error::make(core::ErrorCode::kPredictorInput,
                    std::format("schema has no ch{}_rms feature", ch)));
            }
            rmsIndices->push_back(*index);
        }
        return {};
    };

    auto flat = [rmsIndices](std::span<const double> values) -> core::Expected<predict::Prediction> {
        predict::Prediction prediction;
        prediction.scores.reserve(rmsIndices->size());
        for (core::usize index : *rmsIndices)
            prediction.scores.push_back(values[index]);

        const auto best = std::max_element(prediction.scores.begin(), prediction.scores.end());
        if (best == prediction.scores.end())
        {
            return std::unexpected(core::Error::make(core::ErrorCode::kPredictorFailure, "no channels scored"));
        }
        prediction.label = std::format("ch{}", std::distance(prediction.scores.begin(), best));
        return prediction;
    };

    return std::make_shared<predict::CallbackPredictor>(std::move(flat), predict::CallbackPredictor::KeyedFn{},
                                                        std::move(onBind));
}

} // namespace

int main(int argc, char* argv[])
{
    auto args = parseArgs(argc, argv);
    if (!args)
    {
        core::Log::error(args.error().format());
        printHelp();
        return 2;
    }
    if (args->help)
    {
        printHelp();
        return 0;
    }

    core::Log::info("=== biosig stream ===");

    auto pipeline = makePipeline(*args);
    if (!pipeline)
    {
        core::Log::error(std::format("pipeline: {}", pipeline.error().format()));
        return 1;
    }
    if (!args->savePipelinePath.empty())
    {
        if (auto saved = dsp::savePipeline(*pipeline, args->savePipelinePath); !saved)
        {
            core::Log::error(std::format("save pipeline: {}", saved.error().format()));
            return 1;
        }
        core::Log::info(std::format("pipeline written to {}", args->savePipelinePath));
    }

    const auto schedulerConfig = realtime::SchedulerConfig::Builder{}
        .windowSeconds(args->windowSeconds)
        .stepSeconds(args->stepSeconds)
        .sampleRate(args->sampleRate)
        .build();

    const auto windowSamples = static_cast<core::usize>(std::llround(args->windowSeconds * args->sampleRate));
    const auto capacity = std::max<core::usize>(windowSamples * 4, static_cast<core::usize>(2.0 * args->sampleRate));
    auto ring = std::make_shared<dsp::RingBuffer>(args->channels, capacity);

    auto extractor = std::make_shared<const feature::FeatureExtractor>(feature::FeatureExtractorConfig{
        .windowSeconds = args->windowSeconds,
        .stepSeconds = args->stepSeconds,
    });

    auto sink = [](const realtime::TickResult& result) {
        core::Log::info("stream", std::format("t={:.3f}s label={} latency={:.2f}ms",
            result.windowEndTimestamp, result.prediction.label, result.latencySeconds * 1e3));
    };

    auto scheduler = realtime::RealtimeScheduler::create(ring, std::move(*pipeline), extractor,
                                                         makePredictor(args->channels), sink, schedulerConfig);
    if (!scheduler)
    {
        core::Log::error(std::format("scheduler: {}", scheduler.error().format()));
        return 1;
    }

    source::SyntheticSource synthetic(source::SyntheticSourceConfig{
        .channelCount = args->channels,
        .sampleRate = args->sampleRate,
        .profile = makeProfile(args->channels),
        .seed = args->seed,
        .realtime = true,
        .durationSeconds = std::nullopt,
        .channelLabels = {},
    });
    source::AcquisitionPump pump(synthetic, *ring);

    if (auto started = pump.start(); !started)
    {
        core::Log::error(std::format("acquisition: {}", started.error().format()));
        return 1;
    }
    if (auto started = (*scheduler)->start(); !started)
    {
        core::Log::error(std::format("scheduler: {}", started.error().format()));
        pump.stop();
        return 1;
    }

    std::signal(SIGINT, onSignal);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(args->durationSeconds);
    while (!gInterrupted.load() && std::chrono::steady_clock::now() < deadline && !pump.lastError())
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

    (*scheduler)->stop();
    pump.stop();

    const auto stats = (*scheduler)->stats();
    core::Log::info(std::format("{} predictions, {} overruns, max latency {:.2f} ms, {} samples acquired",
        stats.completed, stats.overruns, stats.maxLatencySeconds * 1e3, pump.samplesPumped()));

    if (auto error = pump.lastError())
    {
        core::Log::error(std::format("acquisition stopped early: {}", error->format()));
        return 1;
    }
    return 0;
}
