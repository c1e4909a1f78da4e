#include "aerojudge/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "aerojudge/util/strings.h"

namespace aerojudge::log {
namespace {
std::mutex g_mu;
std::atomic<int> g_level{static_cast<int>(Level::Info)};

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  const auto cur = static_cast<Level>(g_level.load(std::memory_order_relaxed));
  if (cur == Level::Off || l < cur) return;
  // Replay workers log concurrently; keep lines whole.
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }
Level level() { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

bool parse_level(const std::string& text, Level& out) {
  const std::string s = to_lower(text);
  if (s == "debug") {
    out = Level::Debug;
  } else if (s == "info") {
    out = Level::Info;
  } else if (s == "warn" || s == "warning") {
    out = Level::Warn;
  } else if (s == "error") {
    out = Level::Error;
  } else if (s == "off" || s == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info: return "info";
    case Level::Warn: return "warn";
    case Level::Error: return "error";
    case Level::Off: return "off";
  }
  return "info";
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace aerojudge::log
