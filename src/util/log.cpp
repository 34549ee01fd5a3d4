#include "hextactics/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "hextactics/util/strings.h"

namespace hextactics::log {
namespace {

std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

void emit(Level l, const std::string& msg) {
  const Level threshold = g_level.load();
  if (threshold == Level::Off || l < threshold) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

bool parse_level(const std::string& text, Level* out) {
  const std::string t = to_lower(text);
  Level l;
  if (t == "debug") {
    l = Level::Debug;
  } else if (t == "info") {
    l = Level::Info;
  } else if (t == "warn" || t == "warning") {
    l = Level::Warn;
  } else if (t == "error") {
    l = Level::Error;
  } else if (t == "off" || t == "none") {
    l = Level::Off;
  } else {
    return false;
  }
  if (out) *out = l;
  return true;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace hextactics::log
