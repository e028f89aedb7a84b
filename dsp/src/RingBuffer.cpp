/**
 * @file RingBuffer.cpp
 * @brief Implementation of the multichannel RingBuffer.
 * @author MasterLaplace
 */

#include "biosig/dsp/RingBuffer.hpp"

#include <algorithm>
#include <format>

namespace biosig::dsp {

RingBuffer::RingBuffer(std::size_t channelCount, std::size_t capacity)
    : _channelCount(std::max<std::size_t>(channelCount, 1)),
      _capacity(std::max<std::size_t>(capacity, 1))
{
    _channels.reserve(_channelCount);
    for (std::size_t ch = 0; ch < _channelCount; ++ch)
        _channels.emplace_back(_capacity);
}

core::ExpectedVoid RingBuffer::push(const SampleMatrix &batch)
{
    if (static_cast<std::size_t>(batch.rows()) != _channelCount) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kChannelCountMismatch,
            std::format("RingBuffer: expected {} channels, got {}", _channelCount, batch.rows())));
    }

    const auto cols = static_cast<std::size_t>(batch.cols());
    std::lock_guard lock(_mutex);
    for (std::size_t ch = 0; ch < _channelCount; ++ch) {
        const auto row = channelView(batch, static_cast<Eigen::Index>(ch));
        // Only the tail of an oversized batch can survive eviction.
        const auto skip = cols > _capacity ? cols - _capacity : 0;
        auto &ring = _channels[ch];
        for (auto it = row.begin() + static_cast<std::ptrdiff_t>(skip); it != row.end(); ++it)
            ring.push_back(*it);
    }
    _totalPushed += cols;
    return {};
}

std::optional<WindowSnapshot> RingBuffer::readLast(std::size_t n) const
{
    std::lock_guard lock(_mutex);
    const auto available = _channels.front().size();
    if (n == 0 || available < n)
        return std::nullopt;

    WindowSnapshot snapshot;
    snapshot.samples.resize(static_cast<Eigen::Index>(_channelCount), static_cast<Eigen::Index>(n));
    snapshot.startIndex = _totalPushed - n;

    for (std::size_t ch = 0; ch < _channelCount; ++ch) {
        const auto &ring = _channels[ch];
        auto out = channelView(snapshot.samples, static_cast<Eigen::Index>(ch));
        std::copy(ring.end() - static_cast<std::ptrdiff_t>(n), ring.end(), out.begin());
    }
    return snapshot;
}

std::size_t RingBuffer::size() const
{
    std::lock_guard lock(_mutex);
    return _channels.front().size();
}

std::uint64_t RingBuffer::totalPushed() const
{
    std::lock_guard lock(_mutex);
    return _totalPushed;
}

void RingBuffer::clear()
{
    std::lock_guard lock(_mutex);
    for (auto &ring : _channels)
        ring.clear();
    _totalPushed = 0;
}

} // namespace biosig::dsp
