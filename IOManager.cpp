#include "IOManager.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(LogLevel, std::string_view)> g_log_handler = nullptr;

std::optional<std::vector<Rule>> rules_from_json(const json& document) {
  const json* rules = &document;
  if (document.is_object() && document.contains("rules")) {
    rules = &document.at("rules");
  }
  if (!rules->is_array()) {
    IOManager::log(LogLevel::ERROR,
                   "Error: Configuration must be an array of rules or an "
                   "object with a \"rules\" array.");
    return std::nullopt;
  }

  std::vector<Rule> result;
  result.reserve(rules->size());
  for (std::size_t i = 0; i < rules->size(); ++i) {
    try {
      result.push_back((*rules)[i].get<Rule>());
    } catch (const ConfigError& e) {
      IOManager::log(LogLevel::ERROR,
                     std::format("Error in rule #{}: {}", i + 1, e.what()));
      return std::nullopt;
    } catch (const json::exception& e) {
      IOManager::log(LogLevel::ERROR,
                     std::format("Error in rule #{}: {}", i + 1, e.what()));
      return std::nullopt;
    }

    const Rule& rule = result.back();
    if (rule.action == ActionType::MOVE &&
        (!rule.destination || rule.destination->empty())) {
      IOManager::log(LogLevel::WARNING,
                     std::format("Rule #{} moves files but has no "
                                 "'destination'; its matches will be skipped.",
                                 i + 1));
    }
  }
  return result;
}

}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) g_log_stream.close();
  g_log_stream.open(logPath, std::ios_base::app);
}

void IOManager::set_log_handler(
    std::function<void(LogLevel, std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(LogLevel level, std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  std::string full_message =
      std::format("{:%Y-%m-%d %H:%M:%S} | {:<5} | {}", now, level_name(level),
                  message);

  if (g_log_handler) {
    g_log_handler(level, full_message);
  }

  if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<std::vector<Rule>> IOManager::parse_rules(std::string_view text) {
  try {
    return rules_from_json(json::parse(text));
  } catch (const json::parse_error& e) {
    log(LogLevel::ERROR, std::format("Error: Invalid JSON: {}", e.what()));
    return std::nullopt;
  }
}

std::optional<std::vector<Rule>> IOManager::load_rules(
    const fs::path& configPath) {
  std::error_code ec;
  if (!fs::is_regular_file(configPath, ec)) {
    log(LogLevel::ERROR,
        std::format("Error: Configuration file not found at '{}'",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  if (!configFile) {
    log(LogLevel::ERROR,
        std::format("Error: Cannot open configuration file '{}'",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  try {
    auto rules = rules_from_json(json::parse(configFile));
    if (rules) {
      log(LogLevel::INFO,
          std::format("Loaded {} rules from '{}':\n{}", rules->size(),
                      safe_path_to_string(configPath), json(*rules).dump(2)));
    }
    return rules;
  } catch (const json::parse_error& e) {
    log(LogLevel::ERROR,
        std::format("Error: Invalid JSON in configuration file at '{}': {}",
                    safe_path_to_string(configPath), e.what()));
    return std::nullopt;
  }
}

bool IOManager::confirm_deletions(std::istream& in, std::ostream& out,
                                  std::size_t pending) {
  out << std::format(
             "{} file(s) are about to be permanently deleted. Proceed? "
             "Type 'yes' to confirm: ",
             pending)
      << std::flush;

  std::string answer;
  if (!std::getline(in, answer)) {
    out << "\n";
    log(LogLevel::WARNING, "Confirmation prompt closed without an answer.");
    return false;
  }
  return string_to_lower_ascii(trim_ascii(answer)) == "yes";
}
