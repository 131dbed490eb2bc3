#ifdef _WIN32

#include "preflight/process.hpp"

#include <windows.h>

#include <chrono>
#include <thread>

#include "preflight/log.hpp"

namespace preflight {

namespace {

void append_limited(std::string& dst, const char* src, size_t n, std::size_t limit, bool& truncated) {
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = n < avail ? n : avail;
  dst.append(src, take);
  if (take < n) truncated = true;
}

std::wstring widen(const std::string& s) {
  if (s.empty()) return {};
  const int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
  std::wstring out(static_cast<size_t>(n), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
  return out;
}

std::string last_error_message(const std::string& what) {
  return what + ": error " + std::to_string(GetLastError());
}

void close_handle(HANDLE& h) {
  if (h != nullptr && h != INVALID_HANDLE_VALUE) {
    CloseHandle(h);
  }
  h = nullptr;
}

// CommandLineToArgvW quoting rules.
void append_quoted(std::wstring& cmd, const std::wstring& arg) {
  if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
    cmd += arg;
    return;
  }
  cmd += L'"';
  for (auto it = arg.begin();; ++it) {
    size_t backslashes = 0;
    while (it != arg.end() && *it == L'\\') {
      ++it;
      ++backslashes;
    }
    if (it == arg.end()) {
      cmd.append(backslashes * 2, L'\\');
      break;
    }
    if (*it == L'"') {
      cmd.append(backslashes * 2 + 1, L'\\');
    } else {
      cmd.append(backslashes, L'\\');
    }
    cmd += *it;
  }
  cmd += L'"';
}

std::wstring build_command_line(const std::string& program, const std::vector<std::string>& argv) {
  std::wstring cmd;
  append_quoted(cmd, widen(program));
  for (const auto& a : argv) {
    cmd += L' ';
    append_quoted(cmd, widen(a));
  }
  return cmd;
}

// Double-NUL terminated UTF-16 block for CREATE_UNICODE_ENVIRONMENT.
std::wstring build_env_block(const std::map<std::string, std::string>& env) {
  std::wstring block;
  for (const auto& [k, v] : env) {
    block += widen(k + "=" + v);
    block += L'\0';
  }
  block += L'\0';
  if (env.empty()) block += L'\0';
  return block;
}

}  // namespace

CommandResult run_command(const CommandSpec& spec) {
  CommandResult result;
  if (spec.program.empty()) {
    result.error_message = "spawn failed: empty program path";
    return result;
  }

  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
  HANDLE out_r = nullptr, out_w = nullptr, in_r = nullptr, in_w = nullptr;
  if (!CreatePipe(&out_r, &out_w, &sa, 0) || !CreatePipe(&in_r, &in_w, &sa, 0)) {
    result.error_message = "spawn failed: " + last_error_message("CreatePipe");
    close_handle(out_r); close_handle(out_w);
    close_handle(in_r); close_handle(in_w);
    return result;
  }
  SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(in_w, HANDLE_FLAG_INHERIT, 0);

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdOutput = out_w;
  si.hStdError = out_w;
  si.hStdInput = in_r;

  PROCESS_INFORMATION pi{};
  std::wstring cmd = build_command_line(spec.program, spec.argv);
  std::wstring env = build_env_block(spec.env);
  const BOOL created = CreateProcessW(nullptr, cmd.data(), nullptr, nullptr, TRUE,
                                      CREATE_NO_WINDOW | CREATE_UNICODE_ENVIRONMENT,
                                      env.data(), nullptr, &si, &pi);
  close_handle(out_w);
  close_handle(in_r);
  if (!created) {
    result.error_message = "spawn failed: " + last_error_message(spec.program);
    close_handle(out_r);
    close_handle(in_w);
    return result;
  }
  result.spawned = true;

  // Stdin is fed from a helper thread so a child that writes before it reads
  // cannot deadlock against us.
  std::thread feeder([in_w, &spec]() mutable {
    DWORD written = 0;
    size_t offset = 0;
    while (offset < spec.stdin_data.size()) {
      const DWORD chunk = static_cast<DWORD>(spec.stdin_data.size() - offset);
      if (!WriteFile(in_w, spec.stdin_data.data() + offset, chunk, &written, nullptr)) break;
      offset += written;
    }
    CloseHandle(in_w);
  });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  bool done = false;
  while (!done) {
    DWORD avail = 0;
    while (PeekNamedPipe(out_r, nullptr, 0, nullptr, &avail, nullptr) && avail > 0) {
      DWORD got = 0;
      if (!ReadFile(out_r, buf, sizeof(buf), &got, nullptr) || got == 0) break;
      append_limited(result.output, buf, got, spec.max_output_bytes, result.output_truncated);
    }
    if (WaitForSingleObject(pi.hProcess, 5) == WAIT_OBJECT_0) {
      done = true;
    } else if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      TerminateProcess(pi.hProcess, 124);
      WaitForSingleObject(pi.hProcess, INFINITE);
      result.timed_out = true;
      done = true;
    }
  }

  DWORD avail = 0;
  while (PeekNamedPipe(out_r, nullptr, 0, nullptr, &avail, nullptr) && avail > 0) {
    DWORD got = 0;
    if (!ReadFile(out_r, buf, sizeof(buf), &got, nullptr) || got == 0) break;
    append_limited(result.output, buf, got, spec.max_output_bytes, result.output_truncated);
  }
  feeder.join();

  DWORD code = 0;
  GetExitCodeProcess(pi.hProcess, &code);
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
  close_handle(out_r);

  if (result.timed_out) {
    result.exit_code = 124;
    result.error_message = "timed out after " + std::to_string(spec.timeout_ms) + "ms";
  } else {
    result.exit_code = static_cast<int>(code);
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
  HANDLE process{nullptr};
  DWORD pid{0};
  HANDLE stdout_file{nullptr};
  HANDLE stderr_file{nullptr};
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
  return WaitForSingleObject(impl_->process, 0) == WAIT_TIMEOUT;
}

std::unique_ptr<ManagedProcess> ManagedProcess::spawn(const DaemonSpec& spec,
                                                      std::optional<Error>* error) {
  if (error) error->reset();
  auto fail = [&](ErrorCode code, const std::string& msg) {
    if (error) *error = make_error(code, msg);
    return std::unique_ptr<ManagedProcess>();
  };
  if (spec.program.empty()) return fail(ErrorCode::spawn_failed, "empty program path");

  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
  auto impl = std::make_unique<Impl>();
  impl->stdout_file = CreateFileW(widen(spec.stdout_path).c_str(), GENERIC_WRITE,
                                  FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, CREATE_ALWAYS,
                                  FILE_ATTRIBUTE_NORMAL, nullptr);
  if (impl->stdout_file == INVALID_HANDLE_VALUE) {
    return fail(ErrorCode::io_error, last_error_message("cannot create " + spec.stdout_path));
  }
  impl->stderr_file = CreateFileW(widen(spec.stderr_path).c_str(), GENERIC_WRITE,
                                  FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, CREATE_ALWAYS,
                                  FILE_ATTRIBUTE_NORMAL, nullptr);
  if (impl->stderr_file == INVALID_HANDLE_VALUE) {
    const std::string msg = last_error_message("cannot create " + spec.stderr_path);
    close_handle(impl->stdout_file);
    return fail(ErrorCode::io_error, msg);
  }

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdOutput = impl->stdout_file;
  si.hStdError = impl->stderr_file;
  si.hStdInput = nullptr;

  PROCESS_INFORMATION pi{};
  std::wstring cmd = build_command_line(spec.program, spec.argv);
  std::wstring env = build_env_block(spec.env);
  if (!CreateProcessW(nullptr, cmd.data(), nullptr, nullptr, TRUE,
                      CREATE_NO_WINDOW | CREATE_UNICODE_ENVIRONMENT, env.data(), nullptr, &si, &pi)) {
    const std::string msg = last_error_message(spec.program);
    close_handle(impl->stdout_file);
    close_handle(impl->stderr_file);
    return fail(ErrorCode::spawn_failed, msg);
  }
  CloseHandle(pi.hThread);
  impl->process = pi.hProcess;
  impl->pid = pi.dwProcessId;
  return std::unique_ptr<ManagedProcess>(new ManagedProcess(std::move(impl)));
}

std::optional<Error> ManagedProcess::close() {
  if (closed_ || !impl_) return std::nullopt;
  closed_ = true;

  std::optional<Error> first;
  // ERROR_ACCESS_DENIED here means the process already exited.
  if (!TerminateProcess(impl_->process, 1) && GetLastError() != ERROR_ACCESS_DENIED) {
    first = make_error(ErrorCode::process_close_failed, last_error_message("error killing process"));
  }
  if (WaitForSingleObject(impl_->process, INFINITE) != WAIT_OBJECT_0 && !first) {
    first = make_error(ErrorCode::process_close_failed, last_error_message("error waiting on killed process"));
  }
  close_handle(impl_->process);
  close_handle(impl_->stdout_file);
  close_handle(impl_->stderr_file);
  return first;
}

}  // namespace preflight

#endif
