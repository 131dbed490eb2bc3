#include "preflight/log.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

#include "preflight/jsonlite.hpp"

namespace preflight {
namespace log {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_mu;
std::ostream* g_sink = nullptr;
std::string g_event_log_path;
bool g_event_log_warned = false;

void write_line(const std::string& line) {
  std::lock_guard<std::mutex> lk(g_mu);
  std::ostream& out = g_sink ? *g_sink : std::cerr;
  out << line << "\n";
  out.flush();
}

}  // namespace

void set_verbose(bool enabled) { g_verbose.store(enabled, std::memory_order_relaxed); }
bool verbose_enabled() { return g_verbose.load(std::memory_order_relaxed); }

void set_sink(std::ostream* out) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_sink = out;
}

void error(const std::string& message) { write_line("ERROR: " + message); }
void info(const std::string& message) { write_line(message); }

void verbose(const std::string& message) {
  if (!verbose_enabled()) return;
  write_line(message);
}

std::string step_event_to_json(const StepEvent& ev) {
  std::ostringstream o;
  o << "{\"step\":\"" << jsonlite::escape(ev.step) << "\""
    << ",\"ok\":" << (ev.ok ? "true" : "false")
    << ",\"duration_ns\":" << ev.duration_ns
    << ",\"error_code\":\"" << jsonlite::escape(ev.error_code) << "\""
    << ",\"detail\":\"" << jsonlite::escape(ev.detail) << "\""
    << "}";
  return o.str();
}

void set_event_log(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_event_log_path = path;
  g_event_log_warned = false;
}

void emit_step_event(const StepEvent& ev) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_event_log_path.empty()) return;
  std::ofstream ofs(g_event_log_path, std::ios::app | std::ios::binary);
  if (ofs) ofs << step_event_to_json(ev) << "\n";
  if (!ofs && !g_event_log_warned) {
    g_event_log_warned = true;
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "ERROR: cannot append to event log " << g_event_log_path << "\n";
  }
}

}  // namespace log
}  // namespace preflight
