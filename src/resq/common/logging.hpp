/**
 * @file logging.hpp
 * @brief Process-wide leveled logging for the allocation core.
 */
#pragma once
#include "resq/common/common.hpp"

namespace resq
{

/**
 * @brief Severity of a log line.
 */
enum class LogLevel : int
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/**
 * @brief Replacement output for log lines.
 * @details Receives the level and the formatted line (timestamp and tag included).
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * @brief Set the minimum level that is emitted. Default is `Info`.
 */
void set_log_level(LogLevel level) noexcept;

LogLevel get_log_level() noexcept;

/**
 * @brief Route log lines to `sink` instead of stdout/stderr.
 * @param sink The new sink. An empty function restores the default streams.
 */
void set_log_sink(LogSink sink);

/**
 * @brief Emit one log line.
 *
 * @details
 * Lines below the current level are dropped. The default sink writes `Warn`
 * and `Error` to stderr and everything else to stdout.
 *
 * @par Thread safety
 * - Safe to call from any thread; output lines are never interleaved.
 */
void log(LogLevel level, const std::string& message) noexcept;

const char* to_string(LogLevel level) noexcept;

} // namespace resq
