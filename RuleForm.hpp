#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Raw contents of the interactive rule builder, as typed by the user.
struct RuleForm {
  static const std::vector<std::string>& action_labels();

  int action_index = 0;  // index into action_labels()
  std::string destination;
  std::string types;  // "jpg, png" or "jpg png"
  std::string modified_start;
  std::string modified_end;
  std::string created_start;
  std::string created_end;

  // Builds the rule, or leaves `error` describing the first problem.
  std::optional<Rule> to_rule(std::string& error) const;
};
