#include "Organizer.hpp"

#include <format>
#include <utility>

#include "Scanner.hpp"

RunReport run_organizer(const RunContext& context, LogSink& sink,
                        ConfirmFn confirm, FileSystem& filesystem) {
  RunReport report;
  report.files = scan_directory(context.target_dir, sink);
  for (const auto& file : report.files) {
    sink.info(std::format(" - {}", file.name()));
  }

  RuleEngine engine(context.rules, sink);
  report.matches = engine.match_files(report.files);
  for (const auto& match : report.matches) {
    sink.info(std::format(" - File: {}, Action: {} (rule #{})",
                          match.file.name(), action_name(match.rule.action),
                          match.rule_index + 1));
  }

  ActionExecutor executor(context, sink, std::move(confirm), filesystem);
  report.summary = executor.execute(report.matches);

  return report;
}
