#include "SummaryReporter.hpp"

#include <format>

Summary summarize_plan(const std::vector<PlannedAction>& plan,
                       FileSystem& filesystem, LogSink& sink) {
  Summary planned;
  for (const auto& action : plan) {
    // Compression is not implemented, so it never counts.
    if (action.action != ActionType::MOVE &&
        action.action != ActionType::DELETE) {
      continue;
    }
    std::error_code ec;
    const auto size = filesystem.file_size(action.file.path(), ec);
    if (ec) {
      sink.warn(std::format("'{}' is no longer available ({}); not counted.",
                            action.file.name(), ec.message()));
      continue;
    }
    planned.record(action.action, size);
  }
  return planned;
}

std::string format_summary(const Summary& summary, bool dry_run) {
  std::string out = dry_run ? "--- Summary (dry run, nothing was changed) ---\n"
                            : "--- Summary ---\n";
  const std::string_view verb = dry_run ? "to be " : "";
  out += std::format("Files {}moved:      {}\n", verb, summary.moved);
  out += std::format("Files {}deleted:    {}\n", verb, summary.deleted);
  out += std::format("Files {}compressed: {}\n", verb, summary.compressed);
  out += std::format("Total size:         {}\n",
                     format_size(summary.total_size_bytes));
  return out;
}
