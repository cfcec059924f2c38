#include "sqljudge/log.h"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include "util/string_util.h"

namespace sqljudge::log {

namespace {

std::mutex g_mu;
std::ostream* g_sink = nullptr;

Level initial_level() {
  const char* raw = std::getenv("SQLJUDGE_LOG_LEVEL");
  if (!raw || !*raw) return Level::Warn;
  return parse_level(raw);
}

std::atomic<Level>& threshold() {
  static std::atomic<Level> value{initial_level()};
  return value;
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Off:
      return "OFF";
  }
  return "WARN";
}

}  // namespace

Level parse_level(const std::string& name) {
  const std::string lower = util::to_lower(util::trim_ws(name));
  if (lower == "debug") return Level::Debug;
  if (lower == "info") return Level::Info;
  if (lower == "warn" || lower == "warning") return Level::Warn;
  if (lower == "error") return Level::Error;
  if (lower == "off" || lower == "none") return Level::Off;
  return Level::Warn;
}

Level level() { return threshold().load(); }

void set_level(Level lvl) { threshold().store(lvl); }

void set_sink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = sink;
}

void write(Level lvl, const std::string& message) {
  if (lvl == Level::Off || static_cast<int>(lvl) < static_cast<int>(level())) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::ostream& out = g_sink ? *g_sink : std::cerr;
  out << "[sqljudge] " << level_name(lvl) << ": " << message << std::endl;
}

}  // namespace sqljudge::log
