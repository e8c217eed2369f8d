#pragma once

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <optional>
#include <string>

#include "RuleForm.hpp"
#include "types.hpp"

// Terminal form that builds a single rule for an interactive run.
class RuleBuilderUI {
 public:
  RuleBuilderUI();

  // Blocks until the user creates a rule (returned) or cancels (nullopt).
  std::optional<Rule> run();

 private:
  void submit();

  ftxui::ScreenInteractive m_screen;
  RuleForm m_form;
  std::optional<Rule> m_result;
  std::string m_status_text;

  ftxui::Component m_main_container;
};
