/**
 * @file RingBuffer.hpp
 * @brief Bounded multichannel sample history backed by boost::circular_buffer.
 * @author MasterLaplace
 *
 * Holds the most recent `capacity` samples of every channel in arrival
 * order. Pushing past capacity evicts the oldest samples and never blocks
 * the producer. Reads return an independent copy so the consumer can
 * process a window while the producer keeps writing.
 *
 * @see https://www.boost.org/doc/libs/release/doc/html/circular_buffer.html
 */

#pragma once

#include "biosig/core/Expected.hpp"
#include "biosig/core/NonCopyable.hpp"
#include "biosig/dsp/SampleFrame.hpp"

#include <boost/circular_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace biosig::dsp {

/**
 * @brief Snapshot of the newest samples, with the absolute stream index of
 *        the first column.
 */
struct WindowSnapshot {
    SampleMatrix samples;
    std::uint64_t startIndex = 0;
};

/**
 * @brief Thread-safe fixed-capacity ring of multichannel samples.
 *
 * Thread safety: any number of producers may call push() while a consumer
 * calls readLast(); every public member is serialized by one mutex, so a
 * reader never observes a partially written batch.
 *
 * @code
 *   RingBuffer ring(2, 2000);
 *
 *   // Producer thread:
 *   ring.push(batch);              // 2 x n matrix
 *
 *   // Consumer thread:
 *   if (auto window = ring.readLast(200)) { ... }
 * @endcode
 */
class RingBuffer final : private core::NonCopyable<RingBuffer> {
public:
    /**
     * @param channelCount Number of channels (rows) per batch, > 0
     * @param capacity     Samples retained per channel, > 0
     *
     * A zero channel count or capacity is clamped to one.
     */
    RingBuffer(std::size_t channelCount, std::size_t capacity);

    /**
     * @brief Appends a channel-major batch, evicting the oldest samples
     *        when the capacity is exceeded.
     *
     * @param batch channelCount() rows by any number of columns
     * @return kChannelCountMismatch when the row count is wrong
     */
    [[nodiscard]] core::ExpectedVoid push(const SampleMatrix &batch);

    /**
     * @brief Copies the @p n most recent samples of every channel.
     *
     * @return std::nullopt when fewer than @p n samples are buffered
     *         (or @p n is zero)
     */
    [[nodiscard]] std::optional<WindowSnapshot> readLast(std::size_t n) const;

    /** @brief Number of samples currently retained per channel. */
    [[nodiscard]] std::size_t size() const;

    /** @brief Total number of samples pushed since construction or clear(). */
    [[nodiscard]] std::uint64_t totalPushed() const;

    void clear();

    [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }
    [[nodiscard]] std::size_t channelCount() const noexcept { return _channelCount; }

private:
    std::size_t _channelCount;
    std::size_t _capacity;

    mutable std::mutex _mutex;
    std::vector<boost::circular_buffer<double>> _channels;
    std::uint64_t _totalPushed = 0;
};

} // namespace biosig::dsp
