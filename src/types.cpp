#include "preflight/types.hpp"

#include <cstdlib>
#include <filesystem>

namespace preflight {

namespace {

std::string env_or(const char* name, const std::string& def) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : def;
}

// Durations above ten digits (about 115 days of milliseconds) are rejected
// so later deadline and backoff arithmetic cannot overflow.
constexpr std::size_t kMaxDurationDigits = 10;

bool parse_duration_ms(const std::string& s, std::uint64_t& out) {
  if (s.empty() || s.size() > kMaxDurationDigits) return false;
  std::uint64_t acc = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    acc = acc * 10 + static_cast<std::uint64_t>(c - '0');
  }
  out = acc;
  return true;
}

}  // namespace

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::chmod_failed: return "chmod_failed";
    case ErrorCode::staging_failed: return "staging_failed";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::remove_failed: return "remove_failed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::command_failed: return "command_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::version_mismatch: return "version_mismatch";
    case ErrorCode::smoke_failed: return "smoke_failed";
    case ErrorCode::process_close_failed: return "process_close_failed";
    case ErrorCode::daemon_offline: return "daemon_offline";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::config_write_failed: return "config_write_failed";
  }
  return "";
}

std::string Error::describe() const {
  const std::string c = to_string(code);
  if (c.empty()) return message;
  return c + ": " + message;
}

Error make_error(ErrorCode code, std::string message) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  return e;
}

Error wrap(const Error& inner, const std::string& context) {
  return make_error(inner.code, context + ": " + inner.message);
}

std::string default_node_home() {
  const char* p = std::getenv("IPFS_PATH");
  if (p && *p) return p;
  const std::string home = env_or("HOME", env_or("USERPROFILE", "."));
  return (std::filesystem::path(home) / ".ipfs").string();
}

HarnessConfig HarnessConfig::from_env() {
  HarnessConfig c;
  c.staging_root = env_or(
      "PREFLIGHT_STAGING_ROOT",
      (std::filesystem::path(default_node_home()) / "update-staging").string());
  c.home_env_var = env_or("PREFLIGHT_HOME_ENV", c.home_env_var);
  c.verbose = env_or("PREFLIGHT_VERBOSE", "") == "1";
  c.event_log_path = env_or("PREFLIGHT_EVENT_LOG", "");

  std::uint64_t v = 0;
  if (parse_duration_ms(env_or("PREFLIGHT_COMMAND_TIMEOUT_MS", ""), v)) {
    c.command_timeout_ms = v;
  }
  if (parse_duration_ms(env_or("PREFLIGHT_POLL_BASE_MS", ""), v) && v > 0) {
    c.poll.base_interval = std::chrono::milliseconds(v);
  }
  return c;
}

}  // namespace preflight
