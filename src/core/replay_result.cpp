#include "aerojudge/core/replay_result.h"

#include "aerojudge/util/strings.h"

namespace aerojudge {

const char* termination_reason_label(TerminationReason r) {
  switch (r) {
    case TerminationReason::Goal: return "goal";
    case TerminationReason::Timeout: return "timeout";
    case TerminationReason::Collision: return "collision";
    case TerminationReason::BatteryDepleted: return "battery_depleted";
    case TerminationReason::InvalidInput: return "invalid_input";
  }
  return "invalid_input";
}

bool parse_termination_reason(const std::string& text, TerminationReason& out) {
  const std::string s = to_lower(text);
  for (int i = 0; i <= static_cast<int>(TerminationReason::InvalidInput); ++i) {
    const auto r = static_cast<TerminationReason>(i);
    if (s == termination_reason_label(r)) {
      out = r;
      return true;
    }
  }
  // Accept the hyphenated spellings too.
  if (s == "battery-depleted") {
    out = TerminationReason::BatteryDepleted;
    return true;
  }
  if (s == "invalid-input") {
    out = TerminationReason::InvalidInput;
    return true;
  }
  return false;
}

} // namespace aerojudge
