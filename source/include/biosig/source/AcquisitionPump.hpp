/**
 * @file AcquisitionPump.hpp
 * @brief Producer thread moving samples from an ISource into a RingBuffer.
 * @author MasterLaplace
 *
 * Polls the source on a dedicated std::jthread. Empty reads (nothing due
 * yet, or a finite source that ran dry) are not errors: the pump backs
 * off and keeps polling until stopped. A failing read or push ends the
 * worker and is reported through lastError().
 */

#pragma once

#include "biosig/core/Error.hpp"
#include "biosig/core/Expected.hpp"
#include "biosig/core/NonCopyable.hpp"
#include "biosig/dsp/RingBuffer.hpp"
#include "biosig/source/ISource.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace biosig::source {

struct PumpConfig {
    std::size_t chunkSamples = 64;
    std::chrono::milliseconds pollInterval{1};
    std::chrono::milliseconds idleBackoff{5};
};

/**
 * @code
 *   SyntheticSource source(config);
 *   dsp::RingBuffer ring(2, 2000);
 *   AcquisitionPump pump(source, ring);
 *   pump.start();   // starts the source too
 *   ...
 *   pump.stop();
 * @endcode
 */
class AcquisitionPump final : private core::NonCopyable<AcquisitionPump> {
public:
    AcquisitionPump(ISource &source, dsp::RingBuffer &ring, PumpConfig config = {});
    ~AcquisitionPump();

    /**
     * @brief Starts the source and the producer thread.
     *
     * @return kAlreadyRunning, kChannelCountMismatch between source and
     *         ring, or the source's own start() error
     */
    [[nodiscard]] core::ExpectedVoid start();

    /**
     * @brief Stops the producer thread, then the source.
     *
     * Also required after a failure: the source stays started until then.
     */
    void stop() noexcept;

    /** @brief False once stopped or once the worker ended on an error. */
    [[nodiscard]] bool isRunning() const noexcept { return _running.load(); }
    [[nodiscard]] std::uint64_t samplesPumped() const noexcept { return _samplesPumped.load(); }
    [[nodiscard]] std::uint64_t emptyReads() const noexcept { return _emptyReads.load(); }
    [[nodiscard]] std::optional<core::Error> lastError() const;

private:
    void workerLoop(std::stop_token stopToken);
    void fail(core::Error error);

    ISource &_source;
    dsp::RingBuffer &_ring;
    PumpConfig _config;

    std::jthread _worker;
    std::atomic<bool> _running{false};
    bool _sourceActive = false;
    std::atomic<std::uint64_t> _samplesPumped{0};
    std::atomic<std::uint64_t> _emptyReads{0};

    mutable std::mutex _errorMutex;
    std::optional<core::Error> _lastError;
};

} // namespace biosig::source
