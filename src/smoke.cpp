#include "preflight/smoke.hpp"

#include "preflight/log.hpp"
#include "preflight/process.hpp"
#include "preflight/version.hpp"

namespace preflight {

namespace {

std::string strip_one_newline(std::string s) {
  if (!s.empty() && s.back() == '\n') {
    s.pop_back();
    if (!s.empty() && s.back() == '\r') s.pop_back();
  }
  return s;
}

std::string trim(const std::string& s) {
  const char* ws = "\n \t\r";
  const auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string join_args(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& a : args) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

}  // namespace

std::optional<Error> run_cmd(const SmokeContext& ctx, const std::vector<std::string>& args,
                             std::string* output, const std::string& stdin_data) {
  CommandSpec spec;
  spec.program = ctx.binary;
  spec.argv = args;
  spec.env = {{ctx.home_env_var, ctx.home}};
  spec.stdin_data = stdin_data;
  spec.timeout_ms = ctx.timeout_ms;

  log::verbose("  - running `" + join_args(args) + "`");
  const CommandResult r = run_command(spec);
  if (!r.spawned) {
    return make_error(ErrorCode::spawn_failed, r.error_message);
  }
  if (r.timed_out) {
    return make_error(ErrorCode::timeout, r.error_message + ": " + r.output);
  }
  if (r.exit_code != 0) {
    return make_error(ErrorCode::command_failed, r.error_message + ": " + r.output);
  }
  if (output) *output = strip_one_newline(r.output);
  return std::nullopt;
}

std::optional<Error> check_init(const SmokeContext& ctx) {
  if (auto err = run_cmd(ctx, {"init"}, nullptr)) {
    return wrap(*err, "error initializing with new binary");
  }
  return std::nullopt;
}

std::string expected_version_line(const std::string& claimed_version) {
  return "ipfs version " + version::strip_v(claimed_version);
}

std::optional<Error> check_version(const SmokeContext& ctx, const std::string& claimed_version) {
  std::string out;
  if (auto err = run_cmd(ctx, {"version"}, &out)) {
    return wrap(*err, "running version command");
  }
  const std::string want = expected_version_line(claimed_version);
  if (out != want) {
    return make_error(ErrorCode::version_mismatch,
                      "version didn't match: expected \"" + want + "\", got \"" + out + "\"");
  }
  return std::nullopt;
}

bool daemon_checks_supported(const std::string& claimed_version) {
  return !version::precedes(claimed_version, version::PORT_ZERO_MIN_VERSION);
}

std::optional<Error> check_add_cat(const SmokeContext& ctx, std::string* cid) {
  std::string added;
  if (auto err = run_cmd(ctx, {"add", "-q"}, &added, kSmokePayload)) {
    return wrap(*err, "add check failed");
  }
  const std::string id = trim(added);
  if (id.empty()) {
    return make_error(ErrorCode::smoke_failed, "add check failed: no content id in output");
  }

  std::string content;
  if (auto err = run_cmd(ctx, {"cat", id}, &content)) {
    return wrap(*err, "cat check failed");
  }
  if (content != kSmokePayload) {
    return make_error(ErrorCode::smoke_failed,
                      "add/cat check failed: cat " + id + " returned \"" + content + "\"");
  }
  if (cid) *cid = id;
  return std::nullopt;
}

std::optional<Error> check_refs_local(const SmokeContext& ctx) {
  std::string out;
  if (auto err = run_cmd(ctx, {"refs", "local"}, &out)) {
    return wrap(*err, "refs local check failed");
  }
  size_t start = 0;
  while (start <= out.size()) {
    size_t end = out.find('\n', start);
    if (end == std::string::npos) end = out.size();
    std::string line = out.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line == kSmokePayloadCid) return std::nullopt;
    start = end + 1;
  }
  return make_error(ErrorCode::smoke_failed,
                    std::string("expected to see ") + kSmokePayloadCid + " in the local refs: " + out);
}

}  // namespace preflight
