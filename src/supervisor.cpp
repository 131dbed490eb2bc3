#include "preflight/supervisor.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "preflight/log.hpp"
#include "preflight/sandbox.hpp"

namespace fs = std::filesystem;

namespace preflight {

PollOutcome poll_with_linear_backoff(int attempts, std::chrono::milliseconds base,
                                     const std::function<PollOutcome(int)>& probe,
                                     const Sleeper& sleeper) {
  PollOutcome last = PollOutcome::pending;
  for (int i = 0; i < attempts; ++i) {
    last = probe(i);
    if (last != PollOutcome::pending) return last;
    if (i + 1 == attempts) break;
    const auto delay = base * (i + 1);
    if (sleeper) {
      sleeper(delay);
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
  return last;
}

std::optional<std::string> endpoint_from_api_file(const std::string& contents) {
  const auto slash = contents.find_last_of('/');
  std::string port = slash == std::string::npos ? contents : contents.substr(slash + 1);

  const auto first = port.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return std::nullopt;
  port = port.substr(first, port.find_last_not_of(" \t\r\n") - first + 1);

  if (port.size() > 5) return std::nullopt;
  unsigned long value = 0;
  for (char c : port) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  if (value == 0 || value > 65535) return std::nullopt;
  return "localhost:" + port;
}

std::optional<Error> wait_for_api(const std::string& home, const PollPolicy& policy,
                                  std::string* endpoint) {
  const fs::path api_file = fs::path(home) / kApiFileName;
  std::string addr;
  std::string last_contents;
  bool file_seen = false;
  std::optional<Error> hard_error;

  const PollOutcome found = poll_with_linear_backoff(
      policy.file_attempts, policy.base_interval, [&](int) {
        std::error_code ec;
        const auto st = fs::status(api_file, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
          hard_error = make_error(ErrorCode::io_error,
                                  "reading " + api_file.string() + ": " + ec.message());
          return PollOutcome::failed;
        }
        if (!fs::exists(st)) return PollOutcome::pending;

        std::ifstream in(api_file, std::ios::binary);
        if (!in) return PollOutcome::pending;
        std::ostringstream ss;
        ss << in.rdbuf();
        file_seen = true;
        last_contents = ss.str();
        // The daemon may be mid-write; an empty or partial port is retried.
        auto parsed = endpoint_from_api_file(last_contents);
        if (!parsed) return PollOutcome::pending;
        addr = *parsed;
        return PollOutcome::ready;
      });

  if (found == PollOutcome::failed) return hard_error;
  // Only binaries that never write the api file get the legacy endpoint.
  if (found != PollOutcome::ready && file_seen) {
    return make_error(ErrorCode::daemon_offline,
                      "failed to come online (api file " + api_file.string() +
                          " has no usable address: \"" + last_contents + "\")");
  }
  if (found != PollOutcome::ready) {
    addr = policy.fallback_endpoint;
    log::verbose("  - no api file after " + std::to_string(policy.file_attempts) +
                 " attempts, assuming " + addr);
  }

  const PollOutcome online = poll_with_linear_backoff(
      policy.connect_attempts, policy.base_interval,
      [&](int) { return tcp_probe(addr) ? PollOutcome::ready : PollOutcome::pending; });
  if (online != PollOutcome::ready) {
    return make_error(ErrorCode::daemon_offline, "failed to come online (" + addr + ")");
  }
  if (endpoint) *endpoint = addr;
  return std::nullopt;
}

std::optional<Error> start_daemon(const DaemonLaunch& launch, DaemonHandle* out) {
  DaemonSpec spec;
  spec.program = launch.binary;
  spec.argv = {"daemon"};
  spec.env = {{launch.home_env_var, launch.home}};
  spec.stdout_path = (fs::path(launch.home) / kDaemonStdoutName).string();
  spec.stderr_path = (fs::path(launch.home) / kDaemonStderrName).string();

  std::optional<Error> err;
  auto proc = ManagedProcess::spawn(spec, &err);
  if (!proc) {
    return wrap(err.value_or(make_error(ErrorCode::spawn_failed, "unknown spawn failure")),
                "starting daemon");
  }
  log::verbose("  - daemon started, pid " + std::to_string(proc->pid()));

  std::string endpoint;
  if (auto wait_err = wait_for_api(launch.home, launch.poll, &endpoint)) {
    if (auto close_err = proc->close()) {
      log::error("stopping daemon after failed start: " + close_err->message);
    }
    return wait_err;
  }

  if (out) {
    out->process = std::move(proc);
    out->endpoint = endpoint;
  }
  return std::nullopt;
}

}  // namespace preflight
