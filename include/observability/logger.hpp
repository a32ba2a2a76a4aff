#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace payments {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

std::string logLevelToString(LogLevel level);

// Case-insensitive; accepts "warning" for WARN.
std::optional<LogLevel> logLevelFromString(std::string_view name);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe. Writes to std::cerr by default so diagnostics never mix with
 * the balance snapshot on stdout.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const;

  // Set output stream (default: std::cerr)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted when the builder goes out of scope.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, std::uint64_t value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, unsigned value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string getCurrentTimestamp() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define PAYMENTS_LOG_DEBUG(msg) payments::observability::Logger::getInstance().debug(msg, __func__)
#define PAYMENTS_LOG_INFO(msg) payments::observability::Logger::getInstance().info(msg, __func__)
#define PAYMENTS_LOG_WARN(msg) payments::observability::Logger::getInstance().warn(msg, __func__)
#define PAYMENTS_LOG_ERROR(msg) payments::observability::Logger::getInstance().error(msg, __func__)
#define PAYMENTS_LOG_FATAL(msg) payments::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define PAYMENTS_LOG_BUILDER(level, msg) \
  payments::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace payments

#endif  // LOGGER_HPP_
