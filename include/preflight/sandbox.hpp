#pragma once

// preflight/sandbox.hpp: Per-run staging directory and config rewrite.
//
// LAYOUT (inside one staging directory, which is the candidate's home):
//   config          JSON document written by `<bin> init`, rewritten here
//   api             readiness file written by the daemon once its API is bound
//   daemon.stdout   daemon standard output
//   daemon.stderr   daemon standard error
//
// CONFIG REWRITE:
//   The document is handled as a generic JSON tree so fields this harness does
//   not know survive unchanged. Discovery.MDNS.Enabled becomes false and
//   Addresses.{API,Gateway,Swarm} are pointed at ephemeral ports. Missing or
//   wrong-typed keys abort with ErrorCode::config_invalid and the file is left
//   untouched.
//
// LIFETIME:
//   StagingArea owns its directory and removes it through force_remove() when
//   released or destroyed. Never reused across runs.

#include <memory>
#include <optional>
#include <string>

#include "preflight/jsonlite.hpp"
#include "preflight/types.hpp"

namespace preflight {

constexpr const char* kConfigFileName = "config";
constexpr const char* kApiFileName = "api";
constexpr const char* kDaemonStdoutName = "daemon.stdout";
constexpr const char* kDaemonStderrName = "daemon.stderr";

constexpr const char* kSandboxApiAddr = "/ip4/127.0.0.1/tcp/0";
constexpr const char* kSandboxSwarmAddr = "/ip4/0.0.0.0/tcp/0";
constexpr const char* kSandboxGatewayAddr = "";

// Mutates an already parsed config document in place.
std::optional<Error> tweak_config_document(jsonlite::Object& doc);

// Read-modify-write of <home>/config.
std::optional<Error> tweak_config(const std::string& home);

class StagingArea {
 public:
  // Creates `root` if missing, then a fresh "<prefix><random>" directory in it.
  static std::unique_ptr<StagingArea> create(const std::string& root,
                                             const std::string& prefix,
                                             std::optional<Error>* error);

  ~StagingArea();
  StagingArea(const StagingArea&) = delete;
  StagingArea& operator=(const StagingArea&) = delete;

  const std::string& path() const { return path_; }

  // Removes the directory. Only the first call does any work.
  std::optional<Error> release();
  bool released() const { return released_; }

 private:
  explicit StagingArea(std::string path) : path_(std::move(path)) {}

  std::string path_;
  bool released_{false};
};

}  // namespace preflight
