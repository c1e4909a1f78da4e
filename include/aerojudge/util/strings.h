#pragma once

#include <string>

namespace aerojudge {

std::string to_lower(std::string s);

// Fixed-precision decimal formatting for log lines ("0.735").
std::string format_fixed(double v, int decimals = 3);

// Human-friendly seconds: "42.0s", or "n/a" for negative values.
std::string format_seconds(double s);

} // namespace aerojudge
