/**
 * @file logging.hpp
 * @brief spdlog-backed logger and WARDEN_LOG_* macros
 */

#pragma once

#include <string>
#include <string_view>

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace warden {
namespace logging {

enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5,
  OFF = 6
};

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    spdlog::level::level_enum spdlog_level = spdlog::level::info;
    switch (level) {
      case LogLevel::TRACE:
        spdlog_level = spdlog::level::trace;
        break;
      case LogLevel::DEBUG:
        spdlog_level = spdlog::level::debug;
        break;
      case LogLevel::INFO:
        spdlog_level = spdlog::level::info;
        break;
      case LogLevel::WARN:
        spdlog_level = spdlog::level::warn;
        break;
      case LogLevel::ERROR:
        spdlog_level = spdlog::level::err;
        break;
      case LogLevel::CRITICAL:
        spdlog_level = spdlog::level::critical;
        break;
      case LogLevel::OFF:
        spdlog_level = spdlog::level::off;
        break;
    }
    if (logger_) {
      logger_->set_level(spdlog_level);
    }
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

  /**
   * @brief Set the level from its lowercase name, INFO if unrecognised
   */
  void setLogLevel(std::string_view level_str) {
    setLevel(parseLogLevel(level_str));
  }

  static LogLevel parseLogLevel(std::string_view level_str) {
    if (level_str == "trace") return LogLevel::TRACE;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "warn") return LogLevel::WARN;
    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "critical") return LogLevel::CRITICAL;
    if (level_str == "off") return LogLevel::OFF;
    return LogLevel::INFO;
  }

 private:
  Logger() {
    logger_ = spdlog::get("warden");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("warden");
    }
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace warden

// Convenience macros for logging
#define WARDEN_LOG_TRACE(...) \
  warden::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define WARDEN_LOG_DEBUG(...) \
  warden::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define WARDEN_LOG_INFO(...) \
  warden::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define WARDEN_LOG_WARN(...) \
  warden::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define WARDEN_LOG_ERROR(...) \
  warden::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define WARDEN_LOG_CRITICAL(...) \
  warden::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
// No-op macros when logging is disabled
#define WARDEN_LOG_TRACE(...)
#define WARDEN_LOG_DEBUG(...)
#define WARDEN_LOG_INFO(...)
#define WARDEN_LOG_WARN(...)
#define WARDEN_LOG_ERROR(...)
#define WARDEN_LOG_CRITICAL(...)

namespace warden {
namespace logging {
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  void setLogLevel(std::string_view) {}
  static LogLevel parseLogLevel(std::string_view) { return LogLevel::INFO; }
};
}  // namespace logging
}  // namespace warden

#endif
