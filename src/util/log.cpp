#include "slingnet/util/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace slingnet::log {
namespace {

std::mutex g_write_mu;
std::atomic<Level> g_threshold{Level::Info};

const char* tag(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: break;
  }
  return "";
}

void write_line(Level l, const std::string& msg) {
  const Level threshold = g_threshold.load(std::memory_order_relaxed);
  if (threshold == Level::Off || l < threshold) return;
  std::lock_guard<std::mutex> lock(g_write_mu);
  std::cerr << "[" << tag(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_threshold.store(lvl, std::memory_order_relaxed); }
Level level() { return g_threshold.load(std::memory_order_relaxed); }

bool parse_level(const std::string& text, Level* out) {
  std::string t = text;
  std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  Level parsed;
  if (t == "debug") {
    parsed = Level::Debug;
  } else if (t == "info") {
    parsed = Level::Info;
  } else if (t == "warn" || t == "warning") {
    parsed = Level::Warn;
  } else if (t == "error") {
    parsed = Level::Error;
  } else if (t == "off" || t == "none") {
    parsed = Level::Off;
  } else {
    return false;
  }
  if (out) *out = parsed;
  return true;
}

void debug(const std::string& msg) { write_line(Level::Debug, msg); }
void info(const std::string& msg) { write_line(Level::Info, msg); }
void warn(const std::string& msg) { write_line(Level::Warn, msg); }
void error(const std::string& msg) { write_line(Level::Error, msg); }

} // namespace slingnet::log
