/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * libxdrtraj logging - header file
 */

#ifndef XDRTRAJ_XDR_LOG_H
#define XDRTRAJ_XDR_LOG_H

#include <fmt/format.h>
#include <functional>
#include <string>
#include <utility>

namespace xdrtraj {

enum class LogLevel { Debug = 0, Warning = 1, Off = 2 };

using LogCallback = std::function<void(LogLevel, const std::string &)>;

// Replace the sink receiving log messages. An empty callback restores the
// default sink, which prints to stderr.
void set_log_callback(LogCallback callback);

// Messages below `level` are dropped. The initial level is read from the
// XDRTRAJ_LOG_LEVEL environment variable ("debug", "warning" or "off") and
// defaults to LogLevel::Warning.
void set_log_level(LogLevel level);
LogLevel log_level();

namespace log {

void emit(LogLevel level, const std::string &message);

template <typename... Args>
void debug(fmt::format_string<Args...> fmt, Args &&...args) {
  if (log_level() <= LogLevel::Debug) {
    emit(LogLevel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void warning(fmt::format_string<Args...> fmt, Args &&...args) {
  if (log_level() <= LogLevel::Warning) {
    emit(LogLevel::Warning, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

} // namespace log

} // namespace xdrtraj

#endif // XDRTRAJ_XDR_LOG_H
