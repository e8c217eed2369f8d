#pragma once

#include <optional>
#include <string_view>

#include "types.hpp"

// Parses an ISO-8601 date or date-time. Accepted forms:
//   YYYY-MM-DD
//   YYYY-MM-DD[T| ]HH[:MM[:SS[.f{1,6}]]][Z|+HH:MM|-HH:MM]
// Values without an offset are taken as UTC. Returns nullopt if the text is
// malformed or names an impossible date or time.
std::optional<TimePoint> parse_iso8601(std::string_view text);
