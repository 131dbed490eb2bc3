#pragma once

// preflight/process.hpp: Child process primitives.
//
// Two launch modes:
//   run_command()          one-shot: spawn, feed stdin, collect combined
//                          stdout+stderr, wait for exit.
//   ManagedProcess::spawn  background: stdout/stderr redirected to files,
//                          returned as a handle that close() terminates.
//
// ENVIRONMENT:
//   Children receive exactly the variables in `env`; nothing is inherited.
//
// PLATFORM GUARDS:
//   process_posix.cpp  fork/execve, pipes, kill(SIGKILL) + waitpid
//   process_win.cpp    CreateProcessW, anonymous pipes, TerminateProcess
//
// CLOSE SEMANTICS (ManagedProcess):
//   close() kills, then waits, then releases both stream files. Errors from the
//   kill or the wait are returned but the stream files are released anyway.
//   A second close() is a no-op returning nullopt. The destructor calls close()
//   and logs any error.

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "preflight/types.hpp"

namespace preflight {

struct CommandSpec {
  std::string program;
  std::vector<std::string> argv;           // arguments after the program
  std::map<std::string, std::string> env;  // complete child environment
  std::string stdin_data;                  // empty: child reads /dev/null
  std::uint64_t timeout_ms{0};             // 0 = wait indefinitely
  std::size_t max_output_bytes{1u << 20};
};

struct CommandResult {
  bool spawned{false};
  bool timed_out{false};
  bool output_truncated{false};
  int exit_code{-1};       // 128 + signal when killed by a signal
  std::string output;      // combined stdout + stderr, in arrival order
  std::string error_message;

  bool ok() const { return spawned && !timed_out && exit_code == 0; }
};

CommandResult run_command(const CommandSpec& spec);

struct DaemonSpec {
  std::string program;
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string stdout_path;
  std::string stderr_path;
};

class ManagedProcess {
 public:
  struct Impl;

  // Opens both stream files (truncating), then spawns. A stream file that
  // cannot be opened aborts before anything is spawned.
  static std::unique_ptr<ManagedProcess> spawn(const DaemonSpec& spec,
                                               std::optional<Error>* error);

  ~ManagedProcess();
  ManagedProcess(const ManagedProcess&) = delete;
  ManagedProcess& operator=(const ManagedProcess&) = delete;

  std::optional<Error> close();
  bool closed() const { return closed_; }
  long pid() const;

  // Non-blocking: true if the child has not exited yet. Always false once closed.
  bool running() const;

 private:
  explicit ManagedProcess(std::unique_ptr<Impl> impl);

  std::unique_ptr<Impl> impl_;
  bool closed_{false};
};

}  // namespace preflight
