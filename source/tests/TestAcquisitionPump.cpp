/**
 * @file TestAcquisitionPump.cpp
 * @brief Unit tests for source::AcquisitionPump.
 */

#include <catch2/catch_test_macros.hpp>

#include "biosig/source/AcquisitionPump.hpp"
#include "biosig/source/SyntheticSource.hpp"

#include <chrono>
#include <thread>

namespace biosig::source {

namespace {

/// Polls @p done for up to two seconds.
template <typename Pred>
bool waitFor(Pred done)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/// Source whose reads fail after the first one.
class FailingSource final : public ISource {
public:
    core::ExpectedVoid start() override
    {
        ++starts;
        return {};
    }
    core::Expected<dsp::SampleFrame> read(std::size_t) override
    {
        return std::unexpected(core::Error::make(core::ErrorCode::kSourceExhausted, "device closed the stream"));
    }
    void stop() noexcept override { ++stops; }
    SourceInfo info() const override { return {"Failing", {"ch0"}, 100.0}; }

    int starts = 0;
    int stops = 0;
};

} // namespace

TEST_CASE("Pump moves a finite source into the ring", "[source][pump]")
{
    SyntheticSource source({.channelCount = 2, .sampleRate = 1000.0, .durationSeconds = 0.3});
    dsp::RingBuffer ring(2, 1000);
    AcquisitionPump pump(source, ring, {.chunkSamples = 32, .pollInterval = std::chrono::milliseconds(0)});

    REQUIRE(pump.start());
    REQUIRE(pump.isRunning());
    REQUIRE(waitFor([&] { return pump.samplesPumped() == 300; }));
    REQUIRE(waitFor([&] { return pump.emptyReads() > 0; }));

    pump.stop();
    REQUIRE_FALSE(pump.isRunning());
    REQUIRE_FALSE(pump.lastError().has_value());
    REQUIRE(ring.size() == 300);
    REQUIRE(ring.totalPushed() == 300);
}

TEST_CASE("Pump refuses a source whose channel count differs from the ring", "[source][pump]")
{
    SyntheticSource source({.channelCount = 3});
    dsp::RingBuffer ring(2, 100);
    AcquisitionPump pump(source, ring);

    const auto started = pump.start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code == core::ErrorCode::kChannelCountMismatch);
    REQUIRE_FALSE(pump.isRunning());
}

TEST_CASE("Pump cannot be started twice", "[source][pump]")
{
    SyntheticSource source({.channelCount = 1, .realtime = true});
    dsp::RingBuffer ring(1, 100);
    AcquisitionPump pump(source, ring);

    REQUIRE(pump.start());
    REQUIRE(pump.start().error().code == core::ErrorCode::kAlreadyRunning);
    pump.stop();
    pump.stop();
}

TEST_CASE("Pump records a failing read", "[source][pump]")
{
    FailingSource source;
    dsp::RingBuffer ring(1, 100);
    AcquisitionPump pump(source, ring);

    REQUIRE(pump.start());
    REQUIRE(waitFor([&] { return pump.lastError().has_value(); }));
    REQUIRE(pump.lastError()->code == core::ErrorCode::kSourceExhausted);
    REQUIRE(waitFor([&] { return !pump.isRunning(); }));
    REQUIRE(source.stops == 0);

    // A failed pump can be started again without an explicit stop.
    REQUIRE(pump.start());
    REQUIRE(source.starts == 2);
    REQUIRE(source.stops == 1);
    REQUIRE(waitFor([&] { return !pump.isRunning(); }));

    pump.stop();
    pump.stop();
    REQUIRE(source.stops == 2);
}

} // namespace biosig::source
