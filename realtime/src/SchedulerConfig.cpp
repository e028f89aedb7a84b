// /////////////////////////////////////////////////////////////////////////////
/// @file SchedulerConfig.cpp
/// @brief SchedulerConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <biosig/realtime/SchedulerConfig.hpp>

namespace biosig::realtime {

SchedulerConfig::Builder& SchedulerConfig::Builder::windowSeconds(double seconds) noexcept
{
    windowSeconds_ = seconds;
    return *this;
}

SchedulerConfig::Builder& SchedulerConfig::Builder::stepSeconds(double seconds) noexcept
{
    stepSeconds_ = seconds;
    return *this;
}

SchedulerConfig::Builder& SchedulerConfig::Builder::sampleRate(double hz) noexcept
{
    sampleRate_ = hz;
    return *this;
}

SchedulerConfig::Builder& SchedulerConfig::Builder::idleBackoff(std::chrono::milliseconds backoff) noexcept
{
    idleBackoff_ = backoff;
    return *this;
}

SchedulerConfig::Builder& SchedulerConfig::Builder::warnOnOverrun(bool enabled) noexcept
{
    warnOnOverrun_ = enabled;
    return *this;
}

SchedulerConfig::Builder& SchedulerConfig::Builder::historyTicks(std::size_t ticks) noexcept
{
    historyTicks_ = ticks;
    return *this;
}

SchedulerConfig SchedulerConfig::Builder::build() const noexcept
{
    SchedulerConfig cfg;
    cfg.windowSeconds_ = windowSeconds_;
    cfg.stepSeconds_   = stepSeconds_;
    cfg.sampleRate_    = sampleRate_;
    cfg.idleBackoff_   = idleBackoff_;
    cfg.warnOnOverrun_ = warnOnOverrun_;
    cfg.historyTicks_  = historyTicks_;
    return cfg;
}

} // namespace biosig::realtime
