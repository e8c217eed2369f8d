#include <exception>
#include <iostream>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

#include "IOManager.hpp"
#include "Organizer.hpp"
#include "RuleBuilderUI.hpp"
#include "Scanner.hpp"
#include "SummaryReporter.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

namespace {

struct CliOptions {
  fs::path target_dir;
  fs::path config_path = "rules.json";
  fs::path log_path = "deskmanager.log";
  bool dry_run = false;
  bool auto_confirm = false;
  bool interactive = false;
  bool show_help = false;
};

void print_usage(std::FILE* stream) {
  std::println(stream,
               "Usage: deskmanager --dir <path> [--config <file>] [--dry-run] "
               "[--yes] [--interactive] [--log-file <file>]\n"
               "\n"
               "  --dir <path>        Directory to organize (required).\n"
               "  --config <file>     Rules file (default: rules.json).\n"
               "  --dry-run           Show what would happen, change nothing.\n"
               "  --yes               Delete without asking for confirmation.\n"
               "  --interactive       Build a single rule in a form instead of "
               "reading --config.\n"
               "  --log-file <file>   Log file (default: deskmanager.log).\n"
               "  --help              Show this message.\n"
               "\n"
               "Rule dates are ISO-8601 (YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS) and "
               "inclusive.\n"
               "They are read as UTC unless they carry an explicit offset "
               "(Z, +HH:MM or -HH:MM),\n"
               "which is honored: 2024-01-01T00:00:00+05:00 is "
               "2023-12-31T19:00:00 UTC.");
}

std::optional<CliOptions> parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  bool has_dir = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next_value = [&](std::string_view flag) -> std::optional<fs::path> {
      if (i + 1 >= argc) {
        std::println(stderr, "Error: {} expects a value.", flag);
        return std::nullopt;
      }
      return fs::path(argv[++i]);
    };

    if (arg == "--dir") {
      auto value = next_value(arg);
      if (!value) return std::nullopt;
      options.target_dir = *value;
      has_dir = true;
    } else if (arg == "--config") {
      auto value = next_value(arg);
      if (!value) return std::nullopt;
      options.config_path = *value;
    } else if (arg == "--log-file") {
      auto value = next_value(arg);
      if (!value) return std::nullopt;
      options.log_path = *value;
    } else if (arg == "--dry-run") {
      options.dry_run = true;
    } else if (arg == "--yes" || arg == "-y") {
      options.auto_confirm = true;
    } else if (arg == "--interactive") {
      options.interactive = true;
    } else if (arg == "--help" || arg == "-h") {
      options.show_help = true;
      return options;
    } else {
      std::println(stderr, "Error: unknown argument '{}'.", arg);
      return std::nullopt;
    }
  }
  if (!has_dir) {
    std::println(stderr, "Error: --dir is required.");
    return std::nullopt;
  }
  return options;
}

void console_log_handler(LogLevel level, std::string_view line) {
  if (level == LogLevel::INFO) {
    std::println(stdout, "{}", line);
  } else {
    std::println(stderr, "{}", line);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = parse_arguments(argc, argv);
  if (!options) {
    print_usage(stderr);
    return 1;
  }
  if (options->show_help) {
    print_usage(stdout);
    return 0;
  }

  try {
    IOManager::initialize_logger(options->log_path);
    IOManager::set_log_handler(console_log_handler);
    IOManager::log(LogLevel::INFO, "--- DeskManager Started ---");
    IOManager::log(LogLevel::INFO,
                   std::format("Target Directory: {}",
                               safe_path_to_string(options->target_dir)));
    IOManager::log(LogLevel::INFO,
                   std::format("Dry Run: {}", options->dry_run));

    RunContext context;
    context.target_dir = options->target_dir;
    context.dry_run = options->dry_run;
    context.auto_confirm = options->auto_confirm;

    if (options->interactive) {
      // The form owns the terminal while it is open.
      IOManager::set_log_handler(nullptr);
      RuleBuilderUI builder;
      auto rule = builder.run();
      IOManager::set_log_handler(console_log_handler);
      if (!rule) {
        IOManager::log(LogLevel::ERROR,
                       "No rule was created. Nothing to do.");
        return 1;
      }
      context.rules = {*rule};
    } else {
      IOManager::log(LogLevel::INFO,
                     std::format("Config File: {}",
                                 safe_path_to_string(options->config_path)));
      auto rules = IOManager::load_rules(options->config_path);
      if (!rules) {
        IOManager::log(LogLevel::ERROR,
                       "CRITICAL: Failed to load rules. No action taken.");
        return 1;
      }
      context.rules = std::move(*rules);
    }

    IOManager::ProcessLogSink sink;
    RealFileSystem filesystem;
    auto confirm = [](std::size_t pending) {
      return IOManager::confirm_deletions(std::cin, std::cout, pending);
    };

    RunReport report = run_organizer(context, sink, confirm, filesystem);

    const std::string summary =
        format_summary(report.summary, context.dry_run);
    std::print("\n{}", summary);
    IOManager::set_log_handler(nullptr);
    IOManager::log(LogLevel::INFO, summary);
    IOManager::log(LogLevel::INFO, "--- DeskManager Exited Normally ---");
    return 0;

  } catch (const ScanError& e) {
    IOManager::log(LogLevel::ERROR, std::format("Error: {}", e.what()));
    return 1;
  } catch (const std::exception& e) {
    IOManager::log(LogLevel::ERROR,
                   std::format("FATAL EXCEPTION: {}", e.what()));
    return 1;
  }
}
