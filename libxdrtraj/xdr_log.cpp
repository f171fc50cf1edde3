/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * libxdrtraj logging - implementation file
 */

#include "xdr_log.h"
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>

namespace xdrtraj {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Warning:
    return spdlog::level::warn;
  case LogLevel::Off:
    break;
  }
  return spdlog::level::off;
}

LogLevel from_spdlog(spdlog::level::level_enum level) {
  if (level <= spdlog::level::debug) {
    return LogLevel::Debug;
  }
  if (level <= spdlog::level::warn) {
    return LogLevel::Warning;
  }
  return LogLevel::Off;
}

LogLevel level_from_env() {
  const char *env = std::getenv("XDRTRAJ_LOG_LEVEL");
  if (env == nullptr) {
    return LogLevel::Warning;
  }
  if (std::strcmp(env, "debug") == 0) {
    return LogLevel::Debug;
  }
  if (std::strcmp(env, "off") == 0) {
    return LogLevel::Off;
  }
  return LogLevel::Warning;
}

// Hands the formatted message to the user callback, or to a colored stderr
// sink when there is none
class callback_sink
    : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
public:
  callback_sink()
      : fallback(std::make_shared<spdlog::sinks::stderr_color_sink_mt>()) {
    fallback->set_pattern("[%n] %l: %v");
  }

  void set_callback(LogCallback cb) {
    std::lock_guard<std::mutex> guard(lock);
    callback = std::move(cb);
  }

protected:
  void sink_it_(const spdlog::details::log_msg &msg) override {
    LogCallback cb;
    {
      std::lock_guard<std::mutex> guard(lock);
      cb = callback;
    }
    if (!cb) {
      fallback->log(msg);
      return;
    }
    cb(from_spdlog(msg.level),
       std::string(msg.payload.data(), msg.payload.size()));
  }

  void flush_() override { fallback->flush(); }

private:
  std::mutex lock;
  LogCallback callback;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> fallback;
};

struct log_state {
  log_state()
      : sink(std::make_shared<callback_sink>()),
        logger(std::make_shared<spdlog::logger>("xdrtraj", sink)) {
    logger->set_level(to_spdlog(level_from_env()));
  }

  std::shared_ptr<callback_sink> sink;
  std::shared_ptr<spdlog::logger> logger;
};

// not registered with spdlog, so that applications may use the name
log_state &state() {
  static log_state instance;
  return instance;
}

} // namespace

void set_log_callback(LogCallback callback) {
  state().sink->set_callback(std::move(callback));
}

void set_log_level(LogLevel level) {
  state().logger->set_level(to_spdlog(level));
}

LogLevel log_level() { return from_spdlog(state().logger->level()); }

void log::emit(LogLevel level, const std::string &message) {
  state().logger->log(to_spdlog(level), spdlog::string_view_t(message));
}

} // namespace xdrtraj
