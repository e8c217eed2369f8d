#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

// Rule timestamps and file timestamps are compared at microsecond resolution.
using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

// Thrown by the rule deserializers when a rule has the wrong shape.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class ActionType { UNKNOWN, MOVE, DELETE, COMPRESS };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::UNKNOWN, nullptr},
                                          {ActionType::MOVE, "move"},
                                          {ActionType::DELETE, "delete"},
                                          {ActionType::COMPRESS, "compress"}});

inline std::string_view action_name(ActionType action) {
  switch (action) {
    case ActionType::MOVE:
      return "move";
    case ActionType::DELETE:
      return "delete";
    case ActionType::COMPRESS:
      return "compress";
    case ActionType::UNKNOWN:
      break;
  }
  return "unknown";
}

// Inclusive [start, end] window; a missing side is unbounded. The strings are
// kept verbatim and parsed by the matcher.
struct TimeWindow {
  std::optional<std::string> start;
  std::optional<std::string> end;
};

struct DateRange {
  std::optional<TimeWindow> modified;
  std::optional<TimeWindow> created;
};

struct Rule {
  ActionType action = ActionType::UNKNOWN;
  std::optional<std::string> destination;
  // Lower-case extensions without the leading dot.
  std::optional<std::vector<std::string>> types;
  std::optional<DateRange> date_range;
};

namespace detail {
inline const json& require_object(const json& j, std::string_view what) {
  if (!j.is_object()) {
    throw ConfigError(std::format("'{}' must be a JSON object", what));
  }
  return j;
}

inline std::optional<std::string> optional_string(const json& j,
                                                  const char* key,
                                                  std::string_view owner) {
  if (!j.contains(key)) return std::nullopt;
  const auto& value = j.at(key);
  if (!value.is_string()) {
    throw ConfigError(
        std::format("'{}.{}' must be a string, got {}", owner, key,
                    value.type_name()));
  }
  return value.get<std::string>();
}
}  // namespace detail

inline void from_json(const json& j, TimeWindow& w) {
  detail::require_object(j, "date_range window");
  w.start = detail::optional_string(j, "start", "date_range window");
  w.end = detail::optional_string(j, "end", "date_range window");
}

inline void to_json(json& j, const TimeWindow& w) {
  j = json::object();
  if (w.start) j["start"] = *w.start;
  if (w.end) j["end"] = *w.end;
}

inline void from_json(const json& j, DateRange& d) {
  detail::require_object(j, "date_range");
  if (j.contains("modified")) d.modified = j.at("modified").get<TimeWindow>();
  if (j.contains("created")) d.created = j.at("created").get<TimeWindow>();
}

inline void to_json(json& j, const DateRange& d) {
  j = json::object();
  if (d.modified) j["modified"] = *d.modified;
  if (d.created) j["created"] = *d.created;
}

inline void from_json(const json& j, Rule& r) {
  detail::require_object(j, "rule");
  if (!j.contains("action")) {
    throw ConfigError("rule is missing the required 'action' field");
  }
  j.at("action").get_to(r.action);
  if (r.action == ActionType::UNKNOWN) {
    throw ConfigError(std::format(
        "unknown action {} (expected move, delete or compress)",
        j.at("action").dump()));
  }

  r.destination = detail::optional_string(j, "destination", "rule");

  if (j.contains("types")) {
    const auto& types = j.at("types");
    if (!types.is_array()) {
      throw ConfigError("'rule.types' must be an array of strings");
    }
    std::vector<std::string> normalized;
    for (const auto& t : types) {
      if (!t.is_string()) {
        throw ConfigError("'rule.types' must be an array of strings");
      }
      normalized.push_back(normalize_extension(t.get<std::string>()));
    }
    r.types = std::move(normalized);
  }

  if (j.contains("date_range")) {
    r.date_range = j.at("date_range").get<DateRange>();
  }
}

inline void to_json(json& j, const Rule& r) {
  j = json{{"action", r.action}};
  if (r.destination) j["destination"] = *r.destination;
  if (r.types) j["types"] = *r.types;
  if (r.date_range) j["date_range"] = *r.date_range;
}

// Counters shared by the planned (dry-run) and executed (live) summaries.
struct Summary {
  int moved = 0;
  int deleted = 0;
  int compressed = 0;
  std::uintmax_t total_size_bytes = 0;

  void record(ActionType action, std::uintmax_t size) {
    switch (action) {
      case ActionType::MOVE:
        ++moved;
        break;
      case ActionType::DELETE:
        ++deleted;
        break;
      case ActionType::COMPRESS:
        ++compressed;
        break;
      case ActionType::UNKNOWN:
        return;
    }
    total_size_bytes += size;
  }

  bool operator==(const Summary&) const = default;
};

// Everything one organizer run needs; passed by value into the engine.
struct RunContext {
  fs::path target_dir;
  std::vector<Rule> rules;
  bool dry_run = false;
  bool auto_confirm = false;
};
