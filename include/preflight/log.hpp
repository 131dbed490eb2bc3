#pragma once

// preflight/log.hpp: Human log lines and structured step events.
//
// LOG LEVELS:
//   error    always printed, prefixed "ERROR: "
//   info     always printed (terminal success, legacy-skip notice)
//   verbose  printed only when verbose mode is on (per-step progress)
//
// STEP EVENTS:
//   Every orchestrator step emits one StepEvent. When an event log path is set
//   (PREFLIGHT_EVENT_LOG) events are appended to it as JSONL. Emission never
//   fails the caller: an unwritable event log is reported once on the sink.
//
// Thread-safety: sink and event log writes are serialized by one mutex.

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace preflight {
namespace log {

void set_verbose(bool enabled);
bool verbose_enabled();

// Redirect human log lines. nullptr restores std::cerr. Caller keeps ownership.
void set_sink(std::ostream* out);

void error(const std::string& message);
void info(const std::string& message);
void verbose(const std::string& message);

struct StepEvent {
  std::string step;
  bool ok{false};
  std::uint64_t duration_ns{0};
  std::string error_code;
  std::string detail;
};

std::string step_event_to_json(const StepEvent& ev);

// "" disables the event log.
void set_event_log(const std::string& path);
void emit_step_event(const StepEvent& ev);

}  // namespace log

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace preflight
