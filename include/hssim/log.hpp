/**
 * @file log.hpp
 * @brief Diagnostic output sink
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <functional>
#include <string>

namespace hssim
{

/**
 * @brief Severity of a diagnostic line
 */
enum class LogLevel
{
  DEBUG,  // Per-transaction register traffic
  INFO,   // Lifecycle: init, connect, disconnect
  WARN,   // Ignored writes, unknown commands and message types
  ERROR,  // Socket failures
};

/**
 * @brief Diagnostic sink callback
 *
 * @param level Severity
 * @param tag   Component tag, e.g. "TLE92104-SIM"
 * @param text  Message text without trailing newline
 *
 * An empty LogFn discards everything.
 */
using LogFn = std::function<void(LogLevel level, const char* tag, const std::string& text)>;

/**
 * @brief Create a sink printing "[TAG] text" lines to stderr
 *
 * @param min_level Lines below this level are dropped
 */
LogFn make_stderr_logger(LogLevel min_level = LogLevel::DEBUG);

/**
 * @brief printf-style helper forwarding to a sink
 *
 * Does nothing if @p log is empty.
 */
void logf(const LogFn& log, LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

}  // namespace hssim
