#pragma once

#include <string_view>

enum class LogLevel { INFO, WARNING, ERROR };

inline std::string_view level_name(LogLevel level) {
  switch (level) {
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "INFO";
}

// Where the engine reports what it is doing. The scanner, matcher and
// executor only ever talk to this interface, never to a global logger.
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void write(LogLevel level, std::string_view message) = 0;

  void info(std::string_view message) { write(LogLevel::INFO, message); }
  void warn(std::string_view message) { write(LogLevel::WARNING, message); }
  void error(std::string_view message) { write(LogLevel::ERROR, message); }
};
