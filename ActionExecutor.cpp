#include "ActionExecutor.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "SummaryReporter.hpp"

namespace {

fs::path comparable_dir(const fs::path& dir) {
  std::error_code ec;
  fs::path result = fs::weakly_canonical(dir, ec);
  if (ec) result = dir.lexically_normal();
  if (!result.has_filename()) result = result.parent_path();
  return result;
}

}  // namespace

std::vector<PlannedAction> plan_actions(const std::vector<Match>& matches,
                                        const fs::path& target_dir,
                                        LogSink& sink) {
  std::vector<PlannedAction> plan;
  plan.reserve(matches.size());

  for (const auto& match : matches) {
    const std::string name = match.file.name();
    switch (match.rule.action) {
      case ActionType::MOVE: {
        if (!match.rule.destination || match.rule.destination->empty()) {
          sink.warn(std::format(
              "Skipping move for '{}' due to missing 'destination' in rule #{}.",
              name, match.rule_index + 1));
          break;
        }
        fs::path dest_dir = target_dir / *match.rule.destination;
        if (comparable_dir(dest_dir) ==
            comparable_dir(match.file.path().parent_path())) {
          sink.info(std::format("'{}' is already in '{}', leaving it in place.",
                                name, safe_path_to_string(dest_dir)));
          break;
        }
        sink.info(std::format("[MOVE] '{}' -> '{}/'", name,
                              safe_path_to_string(dest_dir)));
        plan.push_back({ActionType::MOVE, match.file, std::move(dest_dir)});
        break;
      }
      case ActionType::DELETE:
        sink.info(std::format("[DELETE] '{}'", name));
        plan.push_back({ActionType::DELETE, match.file, {}});
        break;
      case ActionType::COMPRESS:
        sink.info(std::format("[COMPRESS] '{}' (not yet implemented).", name));
        plan.push_back({ActionType::COMPRESS, match.file, {}});
        break;
      case ActionType::UNKNOWN:
        sink.warn(std::format("Skipping '{}': rule #{} has no known action.",
                              name, match.rule_index + 1));
        break;
    }
  }
  return plan;
}

ActionExecutor::ActionExecutor(const RunContext& context, LogSink& sink,
                               ConfirmFn confirm, FileSystem& filesystem)
    : m_context(context),
      m_sink(sink),
      m_confirm(std::move(confirm)),
      m_filesystem(filesystem) {}

Summary ActionExecutor::execute(const std::vector<Match>& matches) {
  if (matches.empty()) {
    m_sink.info("No files matched any rule. Nothing to do.");
    return {};
  }

  m_sink.info(m_context.dry_run ? "--- DRY RUN ---" : "--- EXECUTING ACTIONS ---");
  const auto plan = plan_actions(matches, m_context.target_dir, m_sink);

  if (m_context.dry_run) {
    return summarize_plan(plan, m_filesystem, m_sink);
  }
  return apply(plan);
}

bool ActionExecutor::deletions_confirmed(
    const std::vector<PlannedAction>& plan) {
  const auto pending = static_cast<std::size_t>(
      std::count_if(plan.begin(), plan.end(), [](const PlannedAction& a) {
        return a.action == ActionType::DELETE;
      }));
  if (pending == 0) return true;
  if (m_context.auto_confirm) {
    m_sink.info(std::format("Deletion of {} file(s) pre-authorized.", pending));
    return true;
  }
  if (!m_confirm) {
    m_sink.warn("No confirmation channel available for deletions.");
    return false;
  }

  try {
    return m_confirm(pending);
  } catch (const std::exception& e) {
    m_sink.warn(std::format("Deletion confirmation interrupted: {}", e.what()));
    return false;
  }
}

Summary ActionExecutor::apply(const std::vector<PlannedAction>& plan) {
  Summary executed;
  const bool delete_allowed = deletions_confirmed(plan);
  if (!delete_allowed) {
    m_sink.warn("Deletion not confirmed. All deletions are cancelled.");
  }

  for (const auto& action : plan) {
    switch (action.action) {
      case ActionType::MOVE:
        move_file(action, executed);
        break;
      case ActionType::DELETE:
        if (delete_allowed) {
          delete_file(action, executed);
        } else {
          m_sink.warn(std::format(
              "Skipping deletion of '{}': deletion was not confirmed.",
              action.file.name()));
        }
        break;
      case ActionType::COMPRESS:
      case ActionType::UNKNOWN:
        break;
    }
  }
  return executed;
}

void ActionExecutor::move_file(const PlannedAction& action, Summary& summary) {
  const fs::path& from = action.file.path();
  std::error_code ec;

  // Sized before the move; afterwards the source path is gone.
  const auto size = m_filesystem.file_size(from, ec);
  if (ec) {
    m_sink.error(std::format("ERROR: Could not move '{}': {}",
                             action.file.name(), ec.message()));
    return;
  }

  m_filesystem.create_directories(action.destination_dir, ec);
  if (ec) {
    m_sink.error(std::format("ERROR: Could not create directory '{}' for '{}': {}",
                             safe_path_to_string(action.destination_dir),
                             action.file.name(), ec.message()));
    return;
  }

  const fs::path wanted = action.destination_dir / from.filename();
  const fs::path to = generate_unique_path(wanted, ec);
  if (ec) {
    m_sink.error(std::format("ERROR: Could not move '{}': cannot check '{}': {}",
                             action.file.name(), safe_path_to_string(wanted),
                             ec.message()));
    return;
  }
  if (to != wanted) {
    m_sink.info(std::format("'{}' already exists, moving as '{}'.",
                            safe_path_to_string(wanted),
                            safe_path_to_string(to.filename())));
  }

  m_filesystem.move_file(from, to, ec);
  if (ec) {
    m_sink.error(std::format("ERROR: Could not move '{}': {}",
                             action.file.name(), ec.message()));
    return;
  }
  summary.record(ActionType::MOVE, size);
}

void ActionExecutor::delete_file(const PlannedAction& action,
                                 Summary& summary) {
  std::error_code ec;
  const auto size = m_filesystem.file_size(action.file.path(), ec);
  if (!ec) m_filesystem.remove_file(action.file.path(), ec);
  if (ec) {
    m_sink.error(std::format("ERROR: Could not delete '{}': {}",
                             action.file.name(), ec.message()));
    return;
  }
  summary.record(ActionType::DELETE, size);
}
