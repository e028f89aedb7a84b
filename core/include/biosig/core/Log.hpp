/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes timestamped lines to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup (tests install a capturing
 * logger to assert on diagnostics).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BIOSIG_CORE_LOG_HPP
    #define BIOSIG_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace biosig::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "ring", "dsp", "realtime").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Safe to call from the producer and scheduler threads concurrently
 * provided the installed ILogger is thread-safe (the default one is).
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /**
     * @brief True when messages at @p level pass the filter.
     *
     * Lets hot paths skip building a message nobody will see.
     */
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("biosig", msg); }
    static void info (std::string_view msg) { info ("biosig", msg); }
    static void warn (std::string_view msg) { warn ("biosig", msg); }
    static void error(std::string_view msg) { error("biosig", msg); }
    static void fatal(std::string_view msg) { fatal("biosig", msg); }
};

} // namespace biosig::core

#endif // BIOSIG_CORE_LOG_HPP
