#pragma once

// preflight/types.hpp: Core value types shared by every harness module.
//
// ERROR MODEL:
//   Fallible operations return std::optional<Error> (nullopt = success) or a
//   result struct carrying ok/error fields. Nothing in the public API throws.
//   wrap() prefixes context and keeps the code, so the orchestrator's single
//   terminal error names the step that failed.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. No borrowed references escape to callers.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace preflight {

enum class ErrorCode {
  none,
  // filesystem
  chmod_failed,
  staging_failed,
  io_error,
  remove_failed,
  // subprocess
  spawn_failed,
  command_failed,
  timeout,
  version_mismatch,
  smoke_failed,
  process_close_failed,
  // readiness
  daemon_offline,
  // parsing / config assertions
  json_parse_error,
  config_invalid,
  config_write_failed,
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string message;

  // "<code>: <message>"
  std::string describe() const;
};

Error make_error(ErrorCode code, std::string message);

// Prefix context onto an error, keeping its code.
Error wrap(const Error& inner, const std::string& context);

// ---------------------------------------------------------------------------
// CandidateBinary: the executable under validation. Immutable for one run.
// ---------------------------------------------------------------------------
struct CandidateBinary {
  std::string path;
  std::string version;  // claimed version, "vMAJOR.MINOR.PATCH"
};

// ---------------------------------------------------------------------------
// PollPolicy: bounds for the two readiness loops.
// ---------------------------------------------------------------------------
// Delay after failed attempt i (0-based) is base_interval * (i + 1).
struct PollPolicy {
  int file_attempts{15};
  int connect_attempts{10};
  std::chrono::milliseconds base_interval{100};
  // Assumed when the candidate never writes its api file (pre-0.3.8 nodes).
  std::string fallback_endpoint{"localhost:5001"};
};

// ---------------------------------------------------------------------------
// HarnessConfig: process-level settings, loaded once from the environment.
// ---------------------------------------------------------------------------
struct HarnessConfig {
  std::string staging_root;                 // parent of per-run sandboxes
  std::string home_env_var{"IPFS_PATH"};    // only variable passed to the candidate
  std::uint64_t command_timeout_ms{120000}; // 0 = unbounded
  PollPolicy poll;
  bool verbose{false};
  std::string event_log_path;

  // Reads PREFLIGHT_STAGING_ROOT, PREFLIGHT_HOME_ENV, PREFLIGHT_VERBOSE,
  // PREFLIGHT_EVENT_LOG, PREFLIGHT_COMMAND_TIMEOUT_MS, PREFLIGHT_POLL_BASE_MS.
  // Unset, unparsable or out-of-range (over ten digits) values keep their
  // defaults.
  static HarnessConfig from_env();
};

// Default production home: $IPFS_PATH, else $HOME/.ipfs.
std::string default_node_home();

}  // namespace preflight
