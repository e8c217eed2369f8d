#include "RuleForm.hpp"

#include <format>

#include "TimeUtils.hpp"

namespace {

// Empty fields mean "unbounded"; anything else has to parse.
bool read_window(const std::string& start, const std::string& end,
                 std::string_view field, std::optional<TimeWindow>& out,
                 std::string& error) {
  const auto s = trim_ascii(start);
  const auto e = trim_ascii(end);
  if (s.empty() && e.empty()) return true;

  auto read_bound = [&](std::string_view text, std::string_view side,
                        std::optional<std::string>& slot) {
    if (text.empty()) return true;
    if (!parse_iso8601(text)) {
      error = std::format("{} {} '{}' is not an ISO-8601 date (YYYY-MM-DD or "
                          "YYYY-MM-DDTHH:MM:SS).",
                          field, side, text);
      return false;
    }
    slot = std::string(text);
    return true;
  };

  TimeWindow window;
  if (!read_bound(s, "start", window.start) ||
      !read_bound(e, "end", window.end)) {
    return false;
  }
  out = std::move(window);
  return true;
}

}  // namespace

const std::vector<std::string>& RuleForm::action_labels() {
  static const std::vector<std::string> labels = {"move", "delete", "compress"};
  return labels;
}

std::optional<Rule> RuleForm::to_rule(std::string& error) const {
  Rule rule;
  switch (action_index) {
    case 0:
      rule.action = ActionType::MOVE;
      break;
    case 1:
      rule.action = ActionType::DELETE;
      break;
    case 2:
      rule.action = ActionType::COMPRESS;
      break;
    default:
      error = "Choose an action.";
      return std::nullopt;
  }

  const auto dest = trim_ascii(destination);
  if (rule.action == ActionType::MOVE) {
    if (dest.empty()) {
      error = "A move rule needs a destination folder.";
      return std::nullopt;
    }
    rule.destination = std::string(dest);
  }

  std::vector<std::string> extensions;
  std::string current;
  for (char c : types + ",") {
    if (c == ',' || c == ' ' || c == ';') {
      if (auto ext = normalize_extension(current); !ext.empty()) {
        extensions.push_back(std::move(ext));
      }
      current.clear();
    } else {
      current += c;
    }
  }
  if (!extensions.empty()) rule.types = std::move(extensions);

  DateRange range;
  if (!read_window(modified_start, modified_end, "Modified", range.modified,
                   error) ||
      !read_window(created_start, created_end, "Created", range.created,
                   error)) {
    return std::nullopt;
  }
  if (range.modified || range.created) rule.date_range = std::move(range);

  error.clear();
  return rule;
}
