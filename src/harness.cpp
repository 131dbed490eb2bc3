#include "preflight/harness.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

#include "preflight/hash.hpp"
#include "preflight/jsonlite.hpp"
#include "preflight/log.hpp"
#include "preflight/sandbox.hpp"
#include "preflight/smoke.hpp"
#include "preflight/supervisor.hpp"
#include "preflight/version.hpp"

namespace fs = std::filesystem;

namespace preflight {

namespace {

const auto kExecutablePerms = fs::perms::owner_all | fs::perms::group_read |
                                  fs::perms::group_exec | fs::perms::others_read |
                                  fs::perms::others_exec;

class ValidationRun {
 public:
  ValidationRun(const CandidateBinary& candidate, const HarnessConfig& config,
                ValidationReport& report)
      : candidate_(candidate), config_(config), report_(report) {}

  ~ValidationRun() { teardown(); }

  ValidationRun(const ValidationRun&) = delete;
  ValidationRun& operator=(const ValidationRun&) = delete;

  void execute();
  void teardown();

 private:
  // Runs one step, records it and emits its event. False stops the sequence.
  bool step(const std::string& name, const std::function<std::optional<Error>()>& fn);
  void emit(const std::string& name, std::uint64_t duration_ns, const std::optional<Error>& err,
            const std::string& detail = "");

  SmokeContext smoke_context() const;

  const CandidateBinary& candidate_;
  const HarnessConfig& config_;
  ValidationReport& report_;

  std::string binary_;
  std::unique_ptr<StagingArea> staging_;
  DaemonHandle daemon_;
  bool torn_down_{false};
};

void ValidationRun::emit(const std::string& name, std::uint64_t duration_ns,
                         const std::optional<Error>& err, const std::string& detail) {
  log::StepEvent ev;
  ev.step = name;
  ev.ok = !err.has_value();
  ev.duration_ns = duration_ns;
  if (err) {
    ev.error_code = to_string(err->code);
    ev.detail = err->message;
  } else {
    ev.detail = detail;
  }
  log::emit_step_event(ev);
}

bool ValidationRun::step(const std::string& name,
                         const std::function<std::optional<Error>()>& fn) {
  std::uint64_t ns = 0;
  std::optional<Error> err;
  {
    ScopeTimer t(ns);
    err = fn();
  }
  emit(name, ns, err);
  if (err) {
    report_.failed_step = name;
    report_.error = wrap(*err, name);
    return false;
  }
  report_.completed_steps.push_back(name);
  return true;
}

SmokeContext ValidationRun::smoke_context() const {
  SmokeContext ctx;
  ctx.binary = binary_;
  ctx.home = staging_ ? staging_->path() : std::string();
  ctx.home_env_var = config_.home_env_var;
  ctx.timeout_ms = config_.command_timeout_ms;
  return ctx;
}

void ValidationRun::execute() {
  const bool prepared =
      step("ensure_executable", [&]() -> std::optional<Error> {
        std::error_code ec;
        const fs::path abs = fs::absolute(candidate_.path, ec);
        binary_ = ec ? candidate_.path : abs.string();
        fs::permissions(binary_, kExecutablePerms, fs::perm_options::replace, ec);
        if (ec) {
          return make_error(ErrorCode::chmod_failed,
                            "cannot make " + binary_ + " executable: " + ec.message());
        }
        return std::nullopt;
      }) &&
      step("fingerprint", [&]() -> std::optional<Error> {
        report_.candidate_digest = hash_file_blake3_hex(binary_);
        if (report_.candidate_digest.empty()) {
          return make_error(ErrorCode::io_error, "cannot read " + binary_);
        }
        return std::nullopt;
      }) &&
      step("create_staging", [&]() -> std::optional<Error> {
        std::optional<Error> err;
        staging_ = StagingArea::create(config_.staging_root, "test", &err);
        if (!staging_) return err.value_or(make_error(ErrorCode::staging_failed, "unknown error"));
        report_.staging_dir = staging_->path();
        log::verbose("  - running init in '" + staging_->path() + "' with new binary");
        return std::nullopt;
      });
  if (!prepared) return;

  const SmokeContext ctx = smoke_context();
  if (!step("run_init", [&] { return check_init(ctx); })) return;

  log::verbose("  - checking new binary outputs correct version");
  if (!step("check_version", [&] { return check_version(ctx, candidate_.version); })) return;

  const bool supported = daemon_checks_supported(candidate_.version);
  report_.completed_steps.push_back("version_gate");
  emit("version_gate", 0, std::nullopt, supported ? "continue" : "skip");
  if (!supported) {
    log::info(std::string("== skipping tests with daemon, versions before ") +
              version::PORT_ZERO_MIN_VERSION + " do not support port zero ==");
    report_.daemon_checks_skipped = true;
    report_.ok = true;
    return;
  }

  log::verbose("  - tweaking test config to avoid external interference");
  if (!step("tweak_config", [&] { return tweak_config(ctx.home); })) return;

  log::verbose("  - starting up daemon");
  if (!step("start_daemon", [&]() -> std::optional<Error> {
        DaemonLaunch launch;
        launch.binary = binary_;
        launch.home = ctx.home;
        launch.home_env_var = config_.home_env_var;
        launch.poll = config_.poll;
        if (auto err = start_daemon(launch, &daemon_)) return err;
        report_.api_endpoint = daemon_.endpoint;
        return std::nullopt;
      })) {
    return;
  }

  log::verbose("  - checking that we can add and cat a file");
  if (!step("round_trip", [&] { return check_add_cat(ctx); })) return;

  log::verbose("  - checking that file shows up in refs local");
  if (!step("refs_local", [&] { return check_refs_local(ctx); })) return;

  report_.ok = true;
}

void ValidationRun::teardown() {
  if (torn_down_) return;
  torn_down_ = true;

  // The daemon holds files inside the staging area; it goes first.
  if (daemon_.process) {
    log::verbose("  - killing test daemon");
    std::uint64_t ns = 0;
    std::optional<Error> err;
    {
      ScopeTimer t(ns);
      err = daemon_.process->close();
    }
    emit("stop_daemon", ns, err);
    if (err) log::verbose("  - error killing test daemon: " + err->message + " (continuing anyway)");
    daemon_.process.reset();
  }

  if (staging_) {
    std::uint64_t ns = 0;
    std::optional<Error> err;
    {
      ScopeTimer t(ns);
      err = staging_->release();
    }
    emit("cleanup", ns, err);
    if (err) log::error("error cleaning up staging directory: " + err->message);
    staging_.reset();
  }
}

}  // namespace

ValidationReport validate_candidate(const CandidateBinary& candidate, const HarnessConfig& config) {
  ValidationReport report;
  const auto start = std::chrono::steady_clock::now();
  {
    ValidationRun run(candidate, config, report);
    run.execute();
    run.teardown();
  }
  report.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start)
          .count());
  if (report.ok) {
    log::info("success!");
  } else if (report.error) {
    log::error(report.error->message);
  }
  return report;
}

std::string report_to_json(const ValidationReport& report) {
  jsonlite::Object obj;
  obj["ok"] = jsonlite::Value(report.ok);
  obj["daemon_checks_skipped"] = jsonlite::Value(report.daemon_checks_skipped);
  if (report.error) {
    jsonlite::Object e;
    e["code"] = jsonlite::Value(to_string(report.error->code));
    e["message"] = jsonlite::Value(report.error->message);
    obj["error"] = jsonlite::Value(std::move(e));
  } else {
    obj["error"] = jsonlite::Value(nullptr);
  }
  obj["failed_step"] = jsonlite::Value(report.failed_step);
  jsonlite::Array steps;
  for (const auto& s : report.completed_steps) steps.emplace_back(s);
  obj["completed_steps"] = jsonlite::Value(std::move(steps));
  obj["staging_dir"] = jsonlite::Value(report.staging_dir);
  obj["candidate_digest"] = jsonlite::Value(report.candidate_digest);
  obj["api_endpoint"] = jsonlite::Value(report.api_endpoint);
  obj["duration_ns"] = jsonlite::Value(report.duration_ns);
  return jsonlite::serialize(jsonlite::Value(std::move(obj)));
}

}  // namespace preflight
