#include "RuleBuilderUI.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>

#include "IOManager.hpp"

using namespace ftxui;

namespace {

Element labelled(const std::string& label, Element field) {
  return hbox({text(label) | size(WIDTH, EQUAL, 18), field | flex});
}

}  // namespace

RuleBuilderUI::RuleBuilderUI()
    : m_screen(ScreenInteractive::TerminalOutput()),
      m_status_text("Fill in the rule and press 'Create'.") {}

void RuleBuilderUI::submit() {
  std::string error;
  if (auto rule = m_form.to_rule(error)) {
    m_result = std::move(rule);
    IOManager::log(LogLevel::INFO,
                   std::format("Interactive rule created: {}",
                               json(*m_result).dump()));
    m_screen.Exit();
    return;
  }
  m_status_text = error;
}

std::optional<Rule> RuleBuilderUI::run() {
  try {
    auto action_radio =
        Radiobox(&RuleForm::action_labels(), &m_form.action_index);
    auto destination_input = Input(&m_form.destination, "e.g. images");
    auto types_input = Input(&m_form.types, "e.g. jpg, png (empty = any)");
    auto modified_start_input =
        Input(&m_form.modified_start, "YYYY-MM-DD[THH:MM:SS]");
    auto modified_end_input =
        Input(&m_form.modified_end, "YYYY-MM-DD[THH:MM:SS]");
    auto created_start_input =
        Input(&m_form.created_start, "YYYY-MM-DD[THH:MM:SS]");
    auto created_end_input =
        Input(&m_form.created_end, "YYYY-MM-DD[THH:MM:SS]");

    auto create_button = Button("  Create  ", [this] { submit(); });
    auto cancel_button = Button("  Cancel  ", [this] {
      IOManager::log(LogLevel::INFO, "Interactive rule builder cancelled.");
      m_result.reset();
      m_screen.Exit();
    });

    m_main_container = Container::Vertical({
        action_radio,
        destination_input,
        types_input,
        modified_start_input,
        modified_end_input,
        created_start_input,
        created_end_input,
        Container::Horizontal({create_button, cancel_button}),
    });

    auto renderer = Renderer(m_main_container, [&] {
      const bool is_move = m_form.action_index == 0;
      Element destination = destination_input->Render();
      if (!is_move) destination = destination | dim;

      return vbox({
                 text(" DeskManager - New Rule ") | bold |
                     color(Color::White) | bgcolor(Color::Blue),
                 labelled("Action", action_radio->Render()),
                 separator(),
                 labelled("Destination", destination),
                 labelled("File types", types_input->Render()),
                 separator(),
                 text("Modified between (inclusive, UTC)") | bold,
                 labelled("  from", modified_start_input->Render()),
                 labelled("  to", modified_end_input->Render()),
                 text("Created between (inclusive, UTC)") | bold,
                 labelled("  from", created_start_input->Render()),
                 labelled("  to", created_end_input->Render()),
                 separator(),
                 hbox({text(" " + m_status_text), filler(),
                       create_button->Render(), cancel_button->Render()}),
             }) |
             border;
    });

    m_screen.Loop(renderer);
  } catch (const std::exception& e) {
    IOManager::log(
        LogLevel::ERROR,
        std::format("CRITICAL: Exception in RuleBuilderUI::run(): {}",
                    e.what()));
    throw;
  }
  return m_result;
}
