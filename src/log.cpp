/**
 * @file log.cpp
 * @brief Diagnostic output sink implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/log.hpp"

#include <cstdarg>
#include <cstdio>

namespace hssim
{

LogFn make_stderr_logger(LogLevel min_level)
{
  return [min_level](LogLevel level, const char* tag, const std::string& text)
  {
    if (level < min_level)
    {
      return;
    }
    std::fprintf(stderr, "[%s] %s\n", tag, text.c_str());
  };
}

void logf(const LogFn& log, LogLevel level, const char* tag, const char* fmt, ...)
{
  if (!log)
  {
    return;
  }

  char buf[256];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  log(level, tag, std::string(buf));
}

}  // namespace hssim
