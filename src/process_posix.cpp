#ifndef _WIN32

#include "preflight/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>

#include "preflight/log.hpp"

namespace preflight {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool set_cloexec(int fd) {
  const int flags = fcntl(fd, F_GETFD);
  return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool make_pipe(int fds[2]) {
  if (pipe(fds) != 0) return false;
  if (!set_cloexec(fds[0]) || !set_cloexec(fds[1])) {
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  return true;
}

// A child that exits before reading its stdin must not kill the harness.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

// argv/envp are built before fork(); the child only calls async-signal-safe
// functions.
struct ExecImage {
  std::vector<std::string> args;
  std::vector<std::string> envs;
  std::vector<char*> argv;
  std::vector<char*> envp;

  ExecImage(const std::string& program, const std::vector<std::string>& argv_in,
            const std::map<std::string, std::string>& env) {
    args.push_back(program);
    args.insert(args.end(), argv_in.begin(), argv_in.end());
    for (const auto& [k, v] : env) envs.push_back(k + "=" + v);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    for (auto& e : envs) envp.push_back(e.data());
    envp.push_back(nullptr);
  }
};

[[noreturn]] void exec_or_report(const ExecImage& image, int report_fd) {
  // SIG_IGN survives execve; the child gets the default disposition back.
  signal(SIGPIPE, SIG_DFL);
  execve(image.argv[0], image.argv.data(), image.envp.data());
  const int err = errno;
  ssize_t unused = write(report_fd, &err, sizeof(err));
  (void)unused;
  _exit(127);
}

// Blocks until the exec report pipe closes. Returns 0 when execve succeeded.
int read_exec_errno(int report_fd) {
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(report_fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

pid_t wait_retry(pid_t pid, int* status, int flags) {
  pid_t w;
  do {
    w = waitpid(pid, status, flags);
  } while (w < 0 && errno == EINTR);
  return w;
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

CommandResult run_command(const CommandSpec& spec) {
  CommandResult result;
  if (spec.program.empty()) {
    result.error_message = "spawn failed: empty program path";
    return result;
  }
  ignore_sigpipe();

  int out_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  const bool feed_stdin = !spec.stdin_data.empty();
  if (!make_pipe(out_pipe) || !make_pipe(exec_pipe) || (feed_stdin && !make_pipe(in_pipe))) {
    result.error_message = std::string("spawn failed: pipe: ") + std::strerror(errno);
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
    close_fd(in_pipe[0]); close_fd(in_pipe[1]);
    return result;
  }

  const ExecImage image(spec.program, spec.argv, spec.env);

  const pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("spawn failed: fork: ") + std::strerror(errno);
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
    close_fd(in_pipe[0]); close_fd(in_pipe[1]);
    return result;
  }

  if (pid == 0) {
    setsid();
    if (feed_stdin) {
      dup2(in_pipe[0], STDIN_FILENO);
    } else {
      const int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
      if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(out_pipe[1], STDERR_FILENO);
    exec_or_report(image, exec_pipe[1]);
  }

  close_fd(out_pipe[1]);
  close_fd(exec_pipe[1]);
  close_fd(in_pipe[0]);

  const int child_errno = read_exec_errno(exec_pipe[0]);
  close_fd(exec_pipe[0]);
  if (child_errno != 0) {
    int status = 0;
    wait_retry(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(in_pipe[1]);
    result.error_message = "spawn failed: " + spec.program + ": " + std::strerror(child_errno);
    return result;
  }
  result.spawned = true;

  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  if (feed_stdin) fcntl(in_pipe[1], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(spec.timeout_ms);
  std::size_t written = 0;
  bool out_open = true;
  char buf[4096];
  int status = 0;
  while (true) {
    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) {
      fds[nfds].fd = out_pipe[0];
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      ++nfds;
    }
    if (in_pipe[1] >= 0) {
      fds[nfds].fd = in_pipe[1];
      fds[nfds].events = POLLOUT;
      fds[nfds].revents = 0;
      ++nfds;
    }
    poll(nfds > 0 ? fds : nullptr, nfds, 5);

    if (out_open) {
      ssize_t n;
      while ((n = read(out_pipe[0], buf, sizeof(buf))) > 0) {
        append_limited(result.output, buf, n, spec.max_output_bytes, result.output_truncated);
      }
      if (n == 0) out_open = false;
    }

    if (in_pipe[1] >= 0) {
      const ssize_t w = write(in_pipe[1], spec.stdin_data.data() + written,
                              spec.stdin_data.size() - written);
      if (w > 0) written += static_cast<std::size_t>(w);
      // EPIPE: the child closed stdin early; its exit status decides.
      if (written >= spec.stdin_data.size() || (w < 0 && errno == EPIPE)) close_fd(in_pipe[1]);
    }

    if (wait_retry(pid, &status, WNOHANG) == pid) break;

    if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      wait_retry(pid, &status, 0);
      result.timed_out = true;
      break;
    }
  }

  // Drain what the child wrote before exiting.
  ssize_t n;
  while (out_open && (n = read(out_pipe[0], buf, sizeof(buf))) > 0) {
    append_limited(result.output, buf, n, spec.max_output_bytes, result.output_truncated);
  }
  close_fd(out_pipe[0]);
  close_fd(in_pipe[1]);

  if (result.timed_out) {
    result.exit_code = 124;
    result.error_message = "timed out after " + std::to_string(spec.timeout_ms) + "ms";
  } else {
    result.exit_code = decode_status(status);
    if (result.exit_code != 0) {
      result.error_message = "exit status " + std::to_string(result.exit_code);
    }
  }
  return result;
}

// ---------------------------------------------------------------------------
// ManagedProcess
// ---------------------------------------------------------------------------

struct ManagedProcess::Impl {
  pid_t pid{-1};
  int stdout_fd{-1};
  int stderr_fd{-1};
};

ManagedProcess::ManagedProcess(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

ManagedProcess::~ManagedProcess() {
  if (auto err = close()) {
    log::error("closing process " + std::to_string(pid()) + ": " + err->message);
  }
}

long ManagedProcess::pid() const { return impl_ ? static_cast<long>(impl_->pid) : -1; }

bool ManagedProcess::running() const {
  if (closed_ || !impl_) return false;
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  // WNOWAIT leaves the child reapable for close().
  if (waitid(P_PID, static_cast<id_t>(impl_->pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return false;
  }
  return info.si_pid == 0;
}

std::unique_ptr<ManagedProcess> ManagedProcess::spawn(const DaemonSpec& spec,
                                                      std::optional<Error>* error) {
  if (error) error->reset();
  auto fail = [&](ErrorCode code, const std::string& msg) {
    if (error) *error = make_error(code, msg);
    return std::unique_ptr<ManagedProcess>();
  };
  if (spec.program.empty()) return fail(ErrorCode::spawn_failed, "empty program path");

  auto impl = std::make_unique<Impl>();
  impl->stdout_fd = open(spec.stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (impl->stdout_fd < 0) {
    return fail(ErrorCode::io_error, "cannot create " + spec.stdout_path + ": " + std::strerror(errno));
  }
  impl->stderr_fd = open(spec.stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (impl->stderr_fd < 0) {
    const std::string msg = "cannot create " + spec.stderr_path + ": " + std::strerror(errno);
    close_fd(impl->stdout_fd);
    return fail(ErrorCode::io_error, msg);
  }
  set_cloexec(impl->stdout_fd);
  set_cloexec(impl->stderr_fd);

  int exec_pipe[2] = {-1, -1};
  if (!make_pipe(exec_pipe)) {
    const std::string msg = std::string("pipe: ") + std::strerror(errno);
    close_fd(impl->stdout_fd);
    close_fd(impl->stderr_fd);
    return fail(ErrorCode::spawn_failed, msg);
  }

  const ExecImage image(spec.program, spec.argv, spec.env);

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string msg = std::string("fork: ") + std::strerror(errno);
    close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
    close_fd(impl->stdout_fd);
    close_fd(impl->stderr_fd);
    return fail(ErrorCode::spawn_failed, msg);
  }

  if (pid == 0) {
    setpgid(0, 0);
    const int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(impl->stdout_fd, STDOUT_FILENO);
    dup2(impl->stderr_fd, STDERR_FILENO);
    exec_or_report(image, exec_pipe[1]);
  }

  close_fd(exec_pipe[1]);
  const int child_errno = read_exec_errno(exec_pipe[0]);
  close_fd(exec_pipe[0]);
  if (child_errno != 0) {
    int status = 0;
    wait_retry(pid, &status, 0);
    close_fd(impl->stdout_fd);
    close_fd(impl->stderr_fd);
    return fail(ErrorCode::spawn_failed, spec.program + ": " + std::strerror(child_errno));
  }

  impl->pid = pid;
  return std::unique_ptr<ManagedProcess>(new ManagedProcess(std::move(impl)));
}

std::optional<Error> ManagedProcess::close() {
  if (closed_ || !impl_) return std::nullopt;
  closed_ = true;

  std::optional<Error> first;
  if (kill(impl_->pid, SIGKILL) != 0) {
    first = make_error(ErrorCode::process_close_failed,
                       std::string("error killing process: ") + std::strerror(errno));
  }
  // Anything the node forked into its group goes too.
  kill(-impl_->pid, SIGKILL);

  int status = 0;
  if (wait_retry(impl_->pid, &status, 0) < 0 && !first) {
    first = make_error(ErrorCode::process_close_failed,
                       std::string("error waiting on killed process: ") + std::strerror(errno));
  }

  close_fd(impl_->stdout_fd);
  close_fd(impl_->stderr_fd);
  return first;
}

}  // namespace preflight

#endif
