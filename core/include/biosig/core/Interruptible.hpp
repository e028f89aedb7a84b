/**
 * @file Interruptible.hpp
 * @brief Sleeps that return early once a std::stop_token is triggered.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BIOSIG_CORE_INTERRUPTIBLE_HPP
    #define BIOSIG_CORE_INTERRUPTIBLE_HPP

    #include <chrono>
    #include <condition_variable>
    #include <mutex>
    #include <stop_token>

namespace biosig::core {

/**
 * @brief Blocks for @p duration or until stop is requested on @p token.
 *
 * @return true if the full duration elapsed, false if interrupted
 */
template <typename Rep, typename Period>
bool interruptibleSleep(const std::stop_token &token, std::chrono::duration<Rep, Period> duration)
{
    if (token.stop_requested())
        return false;
    if (duration <= std::chrono::duration<Rep, Period>::zero())
        return true;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    return !cv.wait_for(lock, token, duration, [&token] { return token.stop_requested(); });
}

} // namespace biosig::core

#endif // BIOSIG_CORE_INTERRUPTIBLE_HPP
