#pragma once

#include <functional>
#include <vector>

#include "FileSystem.hpp"
#include "LogSink.hpp"
#include "RuleEngine.hpp"
#include "types.hpp"

// Asked once per live run, with the number of pending deletions. Returning
// false cancels every deletion of the run.
using ConfirmFn = std::function<bool(std::size_t pending_deletions)>;

// One action the run intends to perform. Moves without a destination and
// moves onto the file's own directory never become planned actions.
struct PlannedAction {
  ActionType action = ActionType::UNKNOWN;
  FileEntry file;
  fs::path destination_dir;  // only set for MOVE
};

// Derives the intended actions from the match list, logging one line per
// match. Never mutates the filesystem.
std::vector<PlannedAction> plan_actions(const std::vector<Match>& matches,
                                        const fs::path& target_dir,
                                        LogSink& sink);

class ActionExecutor {
 public:
  ActionExecutor(const RunContext& context, LogSink& sink, ConfirmFn confirm,
                 FileSystem& filesystem);

  // Dry run: reports and returns the planned summary without touching the
  // filesystem. Live: performs the actions and returns what was done.
  Summary execute(const std::vector<Match>& matches);

 private:
  Summary apply(const std::vector<PlannedAction>& plan);
  bool deletions_confirmed(const std::vector<PlannedAction>& plan);
  void move_file(const PlannedAction& action, Summary& summary);
  void delete_file(const PlannedAction& action, Summary& summary);

  const RunContext& m_context;
  LogSink& m_sink;
  ConfirmFn m_confirm;
  FileSystem& m_filesystem;
};
