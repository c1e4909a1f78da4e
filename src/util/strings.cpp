#include "aerojudge/util/strings.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace aerojudge {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string format_fixed(double v, int decimals) {
  decimals = std::clamp(decimals, 0, 12);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return std::string(buf);
}

std::string format_seconds(double s) {
  if (s < 0.0) return "n/a";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", s);
  return std::string(buf);
}

} // namespace aerojudge
