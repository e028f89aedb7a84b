/**
 * @file ISource.hpp
 * @brief Abstract interface for biosignal acquisition sources.
 * @author MasterLaplace
 *
 * Every acquisition backend (synthetic generator, file replay, hardware
 * drivers living outside this library) implements this interface. Sources
 * are responsible only for raw sample acquisition; signal processing is
 * delegated to the dsp::Pipeline.
 *
 * @see AcquisitionPump, dsp::Pipeline
 */

#pragma once

#include "biosig/core/Expected.hpp"
#include "biosig/dsp/SampleFrame.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace biosig::source {

/**
 * @brief Metadata describing an acquisition source.
 */
struct SourceInfo {
    std::string name;
    std::vector<std::string> channelLabels;
    double sampleRate = 0.0;

    [[nodiscard]] std::size_t channelCount() const noexcept { return channelLabels.size(); }
};

/**
 * @brief Abstract acquisition source for multichannel data.
 *
 * Contract:
 * 1. start() opens the stream. Must be called before read().
 * 2. read(n) returns up to n samples, channel-major, with POSIX-second
 *    timestamps. Zero samples means nothing is available right now (or the
 *    source is exhausted); it is not an error.
 * 3. stop() releases resources and is safe to call repeatedly.
 * 4. info() is valid once start() succeeded.
 */
class ISource {
public:
    virtual ~ISource() = default;

    ISource(const ISource &) = delete;
    ISource &operator=(const ISource &) = delete;
    ISource(ISource &&) = default;
    ISource &operator=(ISource &&) = default;

    /**
     * @brief Opens the acquisition stream.
     *
     * @return void on success, or an Error describing the failure
     */
    [[nodiscard]] virtual core::ExpectedVoid start() = 0;

    /**
     * @brief Reads at most @p maxSamples samples.
     *
     * @return The samples read (possibly none), or kNotInitialized when
     *         the source is not started
     */
    [[nodiscard]] virtual core::Expected<dsp::SampleFrame> read(std::size_t maxSamples) = 0;

    /**
     * @brief Stops acquisition and releases all resources.
     */
    virtual void stop() noexcept = 0;

    /**
     * @brief Returns metadata about this source.
     */
    [[nodiscard]] virtual SourceInfo info() const = 0;

protected:
    ISource() = default;
};

} // namespace biosig::source
