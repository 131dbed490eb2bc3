#pragma once

// preflight/harness.hpp: End-to-end validation of one candidate binary.
//
// STEP ORDER:
//   ensure_executable -> fingerprint -> create_staging -> run_init ->
//   check_version -> version_gate -> tweak_config -> start_daemon ->
//   round_trip -> refs_local
//   teardown: stop_daemon -> cleanup  (always, daemon first, then directory)
//
// A failing step stops the sequence. Teardown still runs and its failures are
// logged without replacing the step error, so a run ends with exactly one
// error or none. Candidates older than v0.3.8 stop successfully at
// version_gate with daemon_checks_skipped set.
//
// Every step, teardown included, emits a log::StepEvent.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "preflight/types.hpp"

namespace preflight {

struct ValidationReport {
  bool ok{false};
  bool daemon_checks_skipped{false};
  std::optional<Error> error;
  std::string failed_step;
  std::vector<std::string> completed_steps;
  std::string staging_dir;
  std::string candidate_digest;  // BLAKE3 hex of the candidate file
  std::string api_endpoint;
  std::uint64_t duration_ns{0};
};

ValidationReport validate_candidate(const CandidateBinary& candidate, const HarnessConfig& config);

std::string report_to_json(const ValidationReport& report);

}  // namespace preflight
