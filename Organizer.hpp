#pragma once

#include <vector>

#include "ActionExecutor.hpp"
#include "FileEntry.hpp"
#include "FileSystem.hpp"
#include "LogSink.hpp"
#include "RuleEngine.hpp"
#include "types.hpp"

struct RunReport {
  std::vector<FileEntry> files;
  std::vector<Match> matches;
  Summary summary;
};

// Scan, match, act and summarize once. Throws ScanError if the target
// directory cannot be listed; everything after the scan is reported through
// `sink` and never aborts the run.
RunReport run_organizer(const RunContext& context, LogSink& sink,
                        ConfirmFn confirm, FileSystem& filesystem);
