#pragma once

#include <optional>
#include <vector>

#include "FileEntry.hpp"
#include "LogSink.hpp"
#include "types.hpp"

struct Match {
  FileEntry file;
  Rule rule;
  std::size_t rule_index = 0;
};

// Resolves each file to the first rule whose conditions all hold.
// Date bounds are parsed once here; a rule with an unparseable bound is
// reported and never matches.
class RuleEngine {
 public:
  RuleEngine(std::vector<Rule> rules, LogSink& sink);

  std::vector<Match> match_files(const std::vector<FileEntry>& files) const;

  // Index of the first satisfying rule, or nullopt. Throws
  // fs::filesystem_error if a date condition needs metadata that cannot be
  // read; match_files() reports that and moves on.
  std::optional<std::size_t> match_file(const FileEntry& file) const;

  bool is_rule_usable(std::size_t index) const {
    return m_compiled.at(index).usable;
  }

 private:
  struct Bounds {
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
  };

  struct CompiledRule {
    bool usable = true;
    std::optional<Bounds> modified;
    std::optional<Bounds> created;
  };

  CompiledRule compile(const Rule& rule, std::size_t index) const;
  std::optional<Bounds> compile_window(const std::optional<TimeWindow>& window,
                                       std::string_view field,
                                       std::size_t index, bool& usable) const;
  bool rule_matches(std::size_t index, const FileEntry& file) const;

  std::vector<Rule> m_rules;
  std::vector<CompiledRule> m_compiled;
  LogSink& m_sink;
  mutable bool m_reported_birth_time_fallback = false;
};
