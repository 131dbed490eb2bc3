#pragma once

// preflight/smoke.hpp: Functional checks run against the candidate binary.
//
// One-shot checks (no daemon):   check_init, check_version
// Daemon-mode checks:            check_add_cat, check_refs_local
//
// Every command runs as `<binary> <args...>` with an environment holding only
// <home_env_var>=<home>. Output is stdout and stderr combined; one trailing
// newline is stripped. A failing check returns an error that carries the
// command's combined output. Callers stop at the first failure.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "preflight/types.hpp"

namespace preflight {

// Payload added by the round-trip check and the content ID it hashes to under
// the node's default CIDv0 (sha2-256, unixfs, balanced layout) settings.
// Recompute the ID if the payload or the node's default addressing changes.
constexpr const char* kSmokePayload = "hello world! This node should work";
constexpr const char* kSmokePayloadCid = "QmTFJQ68kaArzsqz2Yjg1yMyEA5TXTfNw6d9wSFhxtBxz2";

struct SmokeContext {
  std::string binary;
  std::string home;
  std::string home_env_var{"IPFS_PATH"};
  std::uint64_t timeout_ms{0};
};

// Runs one command. On success *output holds the combined output with one
// trailing newline removed.
std::optional<Error> run_cmd(const SmokeContext& ctx,
                             const std::vector<std::string>& args,
                             std::string* output,
                             const std::string& stdin_data = "");

std::optional<Error> check_init(const SmokeContext& ctx);

// "v0.5.0" -> "ipfs version 0.5.0"
std::string expected_version_line(const std::string& claimed_version);
std::optional<Error> check_version(const SmokeContext& ctx, const std::string& claimed_version);

// False for candidates older than version::PORT_ZERO_MIN_VERSION.
bool daemon_checks_supported(const std::string& claimed_version);

// `add -q` with kSmokePayload on stdin, then `cat <id>` must return the
// payload unchanged. *cid (optional) receives the ID the node reported.
std::optional<Error> check_add_cat(const SmokeContext& ctx, std::string* cid = nullptr);

// `refs local` must list kSmokePayloadCid on a line of its own.
std::optional<Error> check_refs_local(const SmokeContext& ctx);

}  // namespace preflight
