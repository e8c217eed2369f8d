#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <vector>

#include "LogSink.hpp"
#include "types.hpp"

namespace IOManager {
// Opens (appending) the log file. Until this is called, lines only go to the
// handler.
void initialize_logger(const fs::path& logPath);

// Every formatted log line is also handed to `handler`, if set.
void set_log_handler(
    std::function<void(LogLevel, std::string_view)> handler);

void log(LogLevel level, std::string_view message);

// Loads an ordered rule list from a JSON file holding either an array of
// rules or an object with a "rules" array. Problems are logged and reported
// as nullopt.
std::optional<std::vector<Rule>> load_rules(const fs::path& configPath);
std::optional<std::vector<Rule>> parse_rules(std::string_view text);

// Console confirmation gate: reads one line from `in` and accepts a
// case-insensitive "yes". EOF or a failed stream counts as "no".
bool confirm_deletions(std::istream& in, std::ostream& out,
                       std::size_t pending);

// Routes engine output into IOManager::log.
class ProcessLogSink : public LogSink {
 public:
  void write(LogLevel level, std::string_view message) override {
    IOManager::log(level, message);
  }
};
}  // namespace IOManager
