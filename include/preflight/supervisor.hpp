#pragma once

// preflight/supervisor.hpp: Background daemon start-up and readiness polling.
//
// READINESS:
//   1. Poll <home>/api up to PollPolicy::file_attempts times. The file holds a
//      multiaddr such as "/ip4/127.0.0.1/tcp/40123"; its last '/' segment is
//      the port and the endpoint becomes "localhost:<port>".
//   2. If the file never appears, assume PollPolicy::fallback_endpoint. Nodes
//      before v0.3.8 never write the file and always listen on 5001. A file
//      that exists but never yields a port is ErrorCode::daemon_offline.
//   3. Connect to the endpoint up to PollPolicy::connect_attempts times.
//      Exhaustion is ErrorCode::daemon_offline ("failed to come online").
//
// BACKOFF:
//   Both loops share poll_with_linear_backoff(): after failed attempt i
//   (0-based) the caller sleeps base * (i + 1). No sleep follows the last
//   attempt.
//
// OWNERSHIP:
//   start_daemon() returns the only handle to the daemon. When readiness
//   fails the daemon is closed before the error is returned.

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "preflight/process.hpp"
#include "preflight/types.hpp"

namespace preflight {

enum class PollOutcome {
  ready,    // stop, success
  pending,  // retry after backoff
  failed,   // stop, hard error reported by the probe
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Runs probe(i) for i in [0, attempts). Returns the outcome of the last probe
// that ran: ready/failed stop early, pending after the budget is spent.
// An empty sleeper means std::this_thread::sleep_for.
PollOutcome poll_with_linear_backoff(int attempts,
                                     std::chrono::milliseconds base,
                                     const std::function<PollOutcome(int)>& probe,
                                     const Sleeper& sleeper = {});

// "/ip4/127.0.0.1/tcp/5002\n" -> "localhost:5002". nullopt if the final
// segment is empty or not a decimal port.
std::optional<std::string> endpoint_from_api_file(const std::string& contents);

// Single TCP connect attempt to "host:port". Closes the socket immediately.
bool tcp_probe(const std::string& endpoint);

// Blocks until the daemon rooted at `home` is reachable. On success *endpoint
// (if non-null) receives the endpoint that answered.
std::optional<Error> wait_for_api(const std::string& home,
                                  const PollPolicy& policy,
                                  std::string* endpoint = nullptr);

struct DaemonLaunch {
  std::string binary;
  std::string home;
  std::string home_env_var{"IPFS_PATH"};
  PollPolicy poll;
};

struct DaemonHandle {
  std::unique_ptr<ManagedProcess> process;
  std::string endpoint;
};

// Spawns `<binary> daemon` with only home_env_var=home in its environment and
// both streams redirected to <home>/daemon.stdout and <home>/daemon.stderr,
// then waits for readiness.
std::optional<Error> start_daemon(const DaemonLaunch& launch, DaemonHandle* out);

}  // namespace preflight
