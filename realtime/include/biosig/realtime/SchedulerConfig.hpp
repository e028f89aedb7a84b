// /////////////////////////////////////////////////////////////////////////////
/// @file SchedulerConfig.hpp
/// @brief Real-time scheduler configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Values are checked by RealtimeScheduler::create(), not here.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <chrono>
#include <cstddef>

namespace biosig::realtime {

/// @brief Immutable scheduler configuration.
class SchedulerConfig
{
public:
    /// @brief Fluent builder for SchedulerConfig.
    class Builder
    {
    public:
        /// @brief Analysis window length in seconds.
        Builder& windowSeconds(double seconds) noexcept;
        /// @brief Target interval between ticks in seconds.
        Builder& stepSeconds(double seconds) noexcept;
        /// @brief Sampling rate of the samples in the ring buffer.
        Builder& sampleRate(double hz) noexcept;
        /// @brief Wait before polling again when the ring holds too few samples.
        Builder& idleBackoff(std::chrono::milliseconds backoff) noexcept;
        /// @brief Log a warning on every overrun (the counter is kept regardless).
        Builder& warnOnOverrun(bool enabled) noexcept;
        /// @brief Keep only the last @p ticks ticks of pipeline history (0 keeps all).
        Builder& historyTicks(std::size_t ticks) noexcept;

        [[nodiscard]] SchedulerConfig build() const noexcept;

    private:
        double windowSeconds_{0.2};
        double stepSeconds_{0.1};
        double sampleRate_{1000.0};
        std::chrono::milliseconds idleBackoff_{5};
        bool warnOnOverrun_{true};
        std::size_t historyTicks_{0};
    };

    [[nodiscard]] double windowSeconds() const noexcept { return windowSeconds_; }
    [[nodiscard]] double stepSeconds()   const noexcept { return stepSeconds_; }
    [[nodiscard]] double sampleRate()    const noexcept { return sampleRate_; }
    [[nodiscard]] std::chrono::milliseconds idleBackoff() const noexcept { return idleBackoff_; }
    [[nodiscard]] bool   warnOnOverrun() const noexcept { return warnOnOverrun_; }
    [[nodiscard]] std::size_t historyTicks() const noexcept { return historyTicks_; }

private:
    friend class Builder;

    double windowSeconds_{0.2};
    double stepSeconds_{0.1};
    double sampleRate_{1000.0};
    std::chrono::milliseconds idleBackoff_{5};
    bool warnOnOverrun_{true};
    std::size_t historyTicks_{0};
};

} // namespace biosig::realtime
