// -----------------------------------------------------------------------------
// log.cpp - Implementation of the zmesh logging facade
//
// API: see include/zmesh/log.hpp
//
// The level is atomic; enabled() never locks. The sink is swapped and called
// under one mutex, and lines from different threads never interleave.
// -----------------------------------------------------------------------------
#include "zmesh/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>

namespace zmesh {
namespace log {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::Info)};
std::mutex g_sink_mutex;
Sink g_sink;   // empty → stderr

void stderr_sink(Level level, const char* tag, const char* msg) {
  std::cerr << "level=" << level_name(level)
            << " tag=" << (tag ? tag : "-")
            << " msg=\"" << msg << "\"\n";
}

} // namespace

void set_level(Level level) {
  g_level.store(static_cast<uint8_t>(level));
}

Level level() {
  return static_cast<Level>(g_level.load());
}

bool enabled(Level lvl) {
  if (lvl == Level::Off) return false;
  return static_cast<uint8_t>(lvl) >= g_level.load();
}

bool parse_level(const std::string& name, Level& out) {
  if (name == "trace") { out = Level::Trace; return true; }
  if (name == "debug") { out = Level::Debug; return true; }
  if (name == "info")  { out = Level::Info;  return true; }
  if (name == "warn" || name == "warning") { out = Level::Warn; return true; }
  if (name == "error") { out = Level::Error; return true; }
  if (name == "off")   { out = Level::Off;   return true; }
  return false;
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Trace: return "trace";
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "unknown";
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void reset_sink() {
  set_sink(Sink{});
}

void write(Level lvl, const char* tag, const char* fmt, ...) {
  if (!enabled(lvl)) return;             // cheap reject before formatting

  char line[LOG_LINE_MAX];
  va_list ap;
  va_start(ap, fmt);
  const int n = std::vsnprintf(line, sizeof(line), fmt, ap);
  va_end(ap);
  if (n < 0) return;                     // encoding error; nothing sensible to print

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) g_sink(lvl, tag, line);
  else        stderr_sink(lvl, tag, line);
}

} // namespace log
} // namespace zmesh
