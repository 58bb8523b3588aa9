// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge logging -- a named spdlog logger shared by all components.
//
// Usage:
//   qbridge::InitLogging(spdlog::level::info, "qbridge.log");
//   qbridge::Log().info("opened {}", id);
//
// Without InitLogging() the logger writes warnings and above to stderr.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace qbridge {

constexpr const char* kLoggerName = "qbridge";

namespace detail {

inline std::shared_ptr<spdlog::logger>& LoggerSlot() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    auto l = std::make_shared<spdlog::logger>(kLoggerName, sink);
    l->set_level(spdlog::level::warn);
    return l;
  }();
  return logger;
}

}  // namespace detail

inline spdlog::logger& Log() { return *detail::LoggerSlot(); }

/// Replace the logger's sinks. Call once at startup, before any session is
/// opened; not safe against concurrent logging.
inline void InitLogging(spdlog::level::level_enum level,
                        const std::string& log_file = std::string()) {
  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(level);
  console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  sinks.push_back(console_sink);

  std::string file_error;
  if (!log_file.empty()) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
      file_sink->set_level(spdlog::level::trace);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& ex) {
      file_error = ex.what();
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  detail::LoggerSlot() = logger;
  if (!file_error.empty()) {
    logger->warn("log file {} unavailable: {}", log_file, file_error);
  }
}

}  // namespace qbridge
