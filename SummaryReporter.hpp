#pragma once

#include <string>
#include <vector>

#include "ActionExecutor.hpp"
#include "FileSystem.hpp"
#include "LogSink.hpp"
#include "types.hpp"

// What a plan would do, sized from the files as they are on disk now. Files
// that have disappeared are skipped with a warning and not counted.
Summary summarize_plan(const std::vector<PlannedAction>& plan,
                       FileSystem& filesystem, LogSink& sink);

// Multi-line, human-readable summary. Identical input gives identical text.
std::string format_summary(const Summary& summary, bool dry_run);
