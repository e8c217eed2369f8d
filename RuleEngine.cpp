#include "RuleEngine.hpp"

#include <algorithm>
#include <format>

#include "TimeUtils.hpp"

namespace {

bool within(TimePoint t, const std::optional<TimePoint>& start,
            const std::optional<TimePoint>& end) {
  if (start && t < *start) return false;
  if (end && t > *end) return false;
  return true;
}

}  // namespace

RuleEngine::RuleEngine(std::vector<Rule> rules, LogSink& sink)
    : m_rules(std::move(rules)), m_sink(sink) {
  m_compiled.reserve(m_rules.size());
  for (std::size_t i = 0; i < m_rules.size(); ++i) {
    m_compiled.push_back(compile(m_rules[i], i));
  }
}

RuleEngine::CompiledRule RuleEngine::compile(const Rule& rule,
                                             std::size_t index) const {
  CompiledRule compiled;
  if (rule.date_range) {
    compiled.modified = compile_window(rule.date_range->modified, "modified",
                                       index, compiled.usable);
    compiled.created = compile_window(rule.date_range->created, "created",
                                      index, compiled.usable);
  }
  return compiled;
}

std::optional<RuleEngine::Bounds> RuleEngine::compile_window(
    const std::optional<TimeWindow>& window, std::string_view field,
    std::size_t index, bool& usable) const {
  if (!window) return std::nullopt;

  Bounds bounds;
  auto parse_bound = [&](const std::optional<std::string>& text,
                         std::string_view side) -> std::optional<TimePoint> {
    if (!text) return std::nullopt;
    auto tp = parse_iso8601(*text);
    if (!tp) {
      m_sink.warn(std::format(
          "Skipping rule #{}: invalid date '{}' in date_range.{}.{}", index + 1,
          *text, field, side));
      usable = false;
    }
    return tp;
  };
  bounds.start = parse_bound(window->start, "start");
  bounds.end = parse_bound(window->end, "end");
  return bounds;
}

bool RuleEngine::rule_matches(std::size_t index, const FileEntry& file) const {
  const Rule& rule = m_rules[index];
  const CompiledRule& compiled = m_compiled[index];
  if (!compiled.usable) return false;

  if (rule.types) {
    const std::string ext = file.extension();
    if (std::find(rule.types->begin(), rule.types->end(), ext) ==
        rule.types->end()) {
      return false;
    }
  }

  if (compiled.modified || compiled.created) {
    const FileMetadata& meta = file.metadata();
    if (compiled.modified &&
        !within(meta.modified, compiled.modified->start,
                compiled.modified->end)) {
      return false;
    }
    if (compiled.created) {
      if (!meta.birth_time_is_native && !m_reported_birth_time_fallback) {
        m_sink.warn(
            "This filesystem does not report file creation times; 'created' "
            "filters use the last metadata change time instead.");
        m_reported_birth_time_fallback = true;
      }
      if (!within(meta.created, compiled.created->start,
                  compiled.created->end)) {
        return false;
      }
    }
  }
  return true;
}

std::optional<std::size_t> RuleEngine::match_file(const FileEntry& file) const {
  for (std::size_t i = 0; i < m_rules.size(); ++i) {
    if (rule_matches(i, file)) return i;
  }
  return std::nullopt;
}

std::vector<Match> RuleEngine::match_files(
    const std::vector<FileEntry>& files) const {
  std::vector<Match> matches;
  for (const auto& file : files) {
    try {
      if (auto index = match_file(file)) {
        matches.push_back(Match{file, m_rules[*index], *index});
      }
    } catch (const fs::filesystem_error& e) {
      m_sink.warn(std::format("Could not read metadata of '{}': {}. Skipping.",
                              file.name(), e.code().message()));
    }
  }

  m_sink.info(std::format("Analysis complete. {} of {} files matched a rule.",
                          matches.size(), files.size()));
  return matches;
}
