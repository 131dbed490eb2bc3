#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "preflight/harness.hpp"
#include "preflight/hash.hpp"
#include "preflight/jsonlite.hpp"
#include "preflight/log.hpp"
#include "preflight/process.hpp"
#include "preflight/remove.hpp"
#include "preflight/sandbox.hpp"
#include "preflight/smoke.hpp"
#include "preflight/supervisor.hpp"
#include "preflight/types.hpp"
#include "preflight/version.hpp"

#ifndef PREFLIGHT_FAKE_NODE_PATH
#error "PREFLIGHT_FAKE_NODE_PATH must name the fake_node test binary"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() /
                     ("preflight_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& p, const std::string& data) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

fs::path write_script(const fs::path& dir, const std::string& name, const std::string& body) {
  const fs::path p = dir / name;
  write_file(p, "#!/bin/sh\n" + body + "\n");
  fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace);
  return p;
}

// A candidate binary: fake_node pinned to one reported version and fault set.
fs::path make_candidate(const fs::path& dir, const std::string& reported_version,
                        const std::string& flags = "") {
  return write_script(dir, "ipfs",
                      std::string("exec '") + PREFLIGHT_FAKE_NODE_PATH + "' --fake-version=" +
                          reported_version + " " + flags + " \"$@\"");
}

preflight::HarnessConfig e2e_config(const fs::path& root) {
  preflight::HarnessConfig c;
  c.staging_root = (root / "staging").string();
  c.command_timeout_ms = 20000;
  c.poll.base_interval = 20ms;
  c.poll.fallback_endpoint = "127.0.0.1:1";
  return c;
}

bool dir_is_empty(const fs::path& p) {
  return fs::is_directory(p) && fs::directory_iterator(p) == fs::directory_iterator();
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  for (const auto& x : v) {
    if (x == s) return true;
  }
  return false;
}

// Loopback listener on an OS-assigned port. connect() succeeds via the backlog.
struct TestListener {
  int fd{-1};
  int port{0};
  TestListener() {
    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    expect(fd >= 0, "listener socket");
    expect(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "listener bind");
    expect(::listen(fd, 16) == 0, "listener listen");
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
  }
  ~TestListener() {
    if (fd >= 0) ::close(fd);
  }
};

const char* kNodeConfig = R"({
  "Addresses": {
    "API": "/ip4/127.0.0.1/tcp/5001",
    "Announce": [],
    "Gateway": "/ip4/127.0.0.1/tcp/8080",
    "Swarm": ["/ip4/0.0.0.0/tcp/4001", "/ip6/::/tcp/4001"]
  },
  "Datastore": {"BloomFilterSize": 0, "StorageMax": "10GB", "GCPeriod": "1h"},
  "Discovery": {"MDNS": {"Enabled": true, "Interval": 10}},
  "Identity": {"PeerID": "QmPeeré"}
})";

// ============================================================================
// Version Comparator
// ============================================================================

void test_precedes_ordering() {
  using preflight::version::precedes;
  expect(precedes("v0.3.7", "v0.3.8"), "v0.3.7 precedes v0.3.8");
  expect(!precedes("v0.3.8", "v0.3.8"), "equal versions do not precede");
  expect(!precedes("v1.0.0", "v0.9.9"), "v1.0.0 does not precede v0.9.9");
  expect(precedes("v0.9.9", "v1.0.0"), "major decides first");
  expect(precedes("v0.3.10", "v0.4.0"), "minor decides before patch");
  expect(precedes("v0.3.9", "v0.3.10"), "components compare numerically");
}

void test_precedes_malformed_is_false() {
  using preflight::version::precedes;
  expect(!precedes("vX.Y.Z", "v0.3.8"), "malformed first arg");
  expect(!precedes("v0.3.7", "vX.Y.Z"), "malformed second arg");
  expect(!precedes("v0.3", "v0.3.8"), "two components");
  expect(!precedes("v0.3.7.1", "v0.3.8"), "four components");
  expect(!precedes("", ""), "empty input");
  expect(!precedes("v0.3.-1", "v0.3.8"), "signed component");
}

void test_semver_parse() {
  const auto v = preflight::version::parse("v12.34.56");
  expect(v.has_value(), "parse v12.34.56");
  expect(v->major == 12 && v->minor == 34 && v->patch == 56, "components");
  expect(preflight::version::parse("0.5.0").has_value(), "leading v is optional");
  expect(!preflight::version::parse("v1..2").has_value(), "empty component rejected");
  expect(preflight::version::strip_v("v0.5.0") == "0.5.0", "strip_v");
  expect(preflight::version::strip_v("0.5.0") == "0.5.0", "strip_v without v");
}

void test_manifest_json() {
  const auto json = preflight::version::manifest_to_json(preflight::version::current_manifest());
  std::optional<preflight::jsonlite::JsonError> err;
  const auto obj = preflight::jsonlite::parse(json, &err);
  expect(!err, "manifest must be valid JSON");
  expect(preflight::jsonlite::get_string(obj, "harness_semver") == preflight::version::HARNESS_SEMVER,
         "manifest reports harness version");
  expect(preflight::jsonlite::get_string(obj, "port_zero_min_version") == "v0.3.8",
         "manifest reports port-zero threshold");
}

// ============================================================================
// Fingerprint
// ============================================================================

void test_blake3_known_vectors() {
  expect(preflight::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(preflight::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_file_fingerprint() {
  const fs::path dir = fresh_dir("hash");
  write_file(dir / "bin", "hello");
  expect(preflight::hash_file_blake3_hex((dir / "bin").string()) == preflight::blake3_hex("hello"),
         "file digest matches in-memory digest");
  expect(preflight::hash_file_blake3_hex((dir / "missing").string()).empty(),
         "missing file yields empty digest");
  fs::remove_all(dir);
}

// ============================================================================
// JSON document model
// ============================================================================

void test_json_round_trip_keeps_unknown_fields() {
  std::optional<preflight::jsonlite::JsonError> err;
  auto obj = preflight::jsonlite::parse(
      R"({"b":[true,null,-2,1.5],"a":1,"c":{"d":"xé","e":18446744073709551615}})", &err);
  expect(!err, "parse must succeed");
  expect(preflight::jsonlite::serialize(preflight::jsonlite::Value(obj)) ==
             "{\"a\":1,\"b\":[true,null,-2,1.5],\"c\":{\"d\":\"x\xc3\xa9\",\"e\":18446744073709551615}}",
         "compact serialization is sorted and lossless");
}

void test_json_strictness() {
  std::optional<preflight::jsonlite::JsonError> err;
  preflight::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");
  err.reset();
  preflight::jsonlite::parse(R"({"a":1} trailing)", &err);
  expect(err.has_value(), "trailing data rejected");
  err.reset();
  preflight::jsonlite::parse(R"([1,2])", &err);
  expect(err.has_value(), "non-object root rejected");
  err.reset();
  preflight::jsonlite::parse(R"({"a":01})", &err);
  expect(err.has_value(), "leading zero rejected");
}

void test_json_string_strictness() {
  std::optional<preflight::jsonlite::JsonError> err;
  preflight::jsonlite::parse("{\"a\":\"line\nbreak\"}", &err);
  expect(err.has_value(), "raw newline inside a string rejected");
  err.reset();
  preflight::jsonlite::parse("{\"a\":\"tab\there\"}", &err);
  expect(err.has_value(), "raw tab inside a string rejected");
  err.reset();
  preflight::jsonlite::parse(R"({"a":"\ud800"})", &err);
  expect(err.has_value(), "lone high surrogate rejected");
  err.reset();
  preflight::jsonlite::parse(R"({"a":"\ud800\u0041"})", &err);
  expect(err.has_value(), "high surrogate followed by a non-surrogate rejected");
  err.reset();
  preflight::jsonlite::parse(R"({"a":"\udc00"})", &err);
  expect(err.has_value(), "lone low surrogate rejected");
  err.reset();
  const auto obj = preflight::jsonlite::parse(R"({"a":"\ud83d\ude00"})", &err);
  expect(!err, "surrogate pair accepted");
  expect(preflight::jsonlite::get_string(obj, "a") == "\xF0\x9F\x98\x80", "pair decodes to UTF-8");
}

void test_json_escape_control_chars() {
  expect(preflight::jsonlite::escape("a\"b\\c\n\x01") == "a\\\"b\\\\c\\n\\u0001",
         "escape quotes, backslashes and control characters");
}

// ============================================================================
// Safe Remover
// ============================================================================

// Refuses direct deletion, as a platform with mandatory locking does for a
// running executable.
class LockedRemoveStrategy : public preflight::RemoveStrategy {
 public:
  explicit LockedRemoveStrategy(bool move_works) : move_works_(move_works) {}
  std::error_code remove(const fs::path&) override {
    return std::make_error_code(std::errc::device_or_resource_busy);
  }
  std::error_code move_aside(const fs::path& from, const fs::path& to) override {
    if (!move_works_) return std::make_error_code(std::errc::permission_denied);
    return preflight::platform_remove_strategy().move_aside(from, to);
  }
  std::string strategy_id() const override { return "locked"; }

 private:
  bool move_works_;
};

void test_remove_missing_path_is_noop() {
  const fs::path dir = fresh_dir("rm_missing");
  std::string relocated = "stale";
  expect(!preflight::force_remove((dir / "nope").string(), &relocated), "missing path succeeds");
  expect(relocated.empty(), "no relocation reported");
  fs::remove_all(dir);
}

void test_remove_file_and_tree() {
  const fs::path dir = fresh_dir("rm_tree");
  write_file(dir / "file", "x");
  fs::create_directories(dir / "tree" / "nested");
  write_file(dir / "tree" / "nested" / "leaf", "y");

  expect(!preflight::force_remove((dir / "file").string()), "file removal");
  expect(!fs::exists(dir / "file"), "file is gone");
  expect(!preflight::force_remove((dir / "tree").string()), "tree removal");
  expect(!fs::exists(dir / "tree"), "tree is gone");
  fs::remove_all(dir);
}

void test_remove_falls_back_to_move() {
  const fs::path dir = fresh_dir("rm_fallback");
  const fs::path trash = dir / "trash";
  fs::create_directories(trash);
  const fs::path target = dir / "ipfs.exe";
  write_file(target, "old binary");

  LockedRemoveStrategy locked(true);
  std::string relocated;
  expect(!preflight::force_remove(target.string(), locked, trash, &relocated),
         "fallback move succeeds");
  expect(!fs::exists(target), "original path is absent");
  expect(!relocated.empty() && fs::exists(relocated), "fallback destination exists");
  expect(fs::path(relocated).parent_path() == trash, "destination is in the temp root");
  const std::string name = fs::path(relocated).filename().string();
  expect(name.size() > 9 && name.substr(name.size() - 9) == " ipfs.exe", "destination keeps the base name");
  expect(read_file(relocated) == "old binary", "destination keeps the content");
  fs::remove_all(dir);
}

void test_remove_reports_both_failures() {
  const fs::path dir = fresh_dir("rm_both");
  const fs::path target = dir / "locked";
  write_file(target, "z");

  LockedRemoveStrategy locked(false);
  const auto err = preflight::force_remove(target.string(), locked, dir);
  expect(err.has_value(), "double failure is an error");
  expect(err->code == preflight::ErrorCode::remove_failed, "remove_failed code");
  expect(err->message.find(std::make_error_code(std::errc::device_or_resource_busy).message()) !=
             std::string::npos,
         "message carries the deletion error");
  expect(err->message.find(std::make_error_code(std::errc::permission_denied).message()) !=
             std::string::npos,
         "message carries the move error");
  expect(fs::exists(target), "target untouched");
  fs::remove_all(dir);
}

void test_fallback_destination_naming() {
  const fs::path dir = fresh_dir("rm_names");
  const std::time_t now = 1700000000;
  const fs::path first = preflight::fallback_destination("/opt/bin/ipfs", dir, now);
  const std::string name = first.filename().string();
  expect(name.size() == std::string("YYYY.MM.DD-HH.MM.SS ipfs").size(), "timestamp + base name");
  expect(name[4] == '.' && name[7] == '.' && name[10] == '-' && name[13] == '.' && name[16] == '.',
         "timestamp layout");
  expect(name.substr(19) == " ipfs", "base name suffix");

  write_file(first, "taken");
  const fs::path second = preflight::fallback_destination("/opt/bin/ipfs", dir, now);
  expect(second.filename().string() == name + "-1", "collision gets a numeric suffix");
  fs::remove_all(dir);
}

void test_fallback_destination_exhausted() {
  const fs::path dir = fresh_dir("rm_exhausted");
  const std::time_t now = 1700000000;
  const fs::path first = preflight::fallback_destination("/opt/bin/ipfs", dir, now);
  write_file(first, "taken");
  for (int i = 1; i <= preflight::kMaxFallbackSuffix; ++i) {
    write_file(first.string() + "-" + std::to_string(i), "taken");
  }
  expect(preflight::fallback_destination("/opt/bin/ipfs", dir, now).empty(),
         "no name returned once every suffix is taken");

  // Through force_remove: cover a few seconds of timestamps so the clock
  // cannot tick past the prepared names.
  const fs::path trash = dir / "trash";
  fs::create_directories(trash);
  const fs::path target = dir / "ipfs";
  write_file(target, "old binary");
  const std::time_t start = std::time(nullptr);
  for (std::time_t t = start; t < start + 5; ++t) {
    const fs::path taken = preflight::fallback_destination(target, trash, t);
    write_file(taken, "earlier relocation");
    for (int i = 1; i <= preflight::kMaxFallbackSuffix; ++i) {
      write_file(taken.string() + "-" + std::to_string(i), "earlier relocation");
    }
  }
  LockedRemoveStrategy locked(true);
  std::string relocated = "stale";
  const auto err = preflight::force_remove(target.string(), locked, trash, &relocated);
  expect(err.has_value() && err->code == preflight::ErrorCode::remove_failed, "remove_failed");
  expect(err->message.find("no free name") != std::string::npos, "cause reported");
  expect(relocated.empty(), "no relocation reported");
  expect(read_file(target) == "old binary", "target left in place");
  expect(read_file(trash / preflight::fallback_destination(target, dir, start).filename()) ==
             "earlier relocation",
         "earlier relocations untouched");
  fs::remove_all(dir);
}

// ============================================================================
// Sandbox Builder
// ============================================================================

void test_tweak_config_rewrites_addresses() {
  const fs::path home = fresh_dir("tweak");
  write_file(home / preflight::kConfigFileName, kNodeConfig);
  expect(!preflight::tweak_config(home.string()), "tweak succeeds");

  std::optional<preflight::jsonlite::JsonError> err;
  const auto doc = preflight::jsonlite::parse(read_file(home / preflight::kConfigFileName), &err);
  expect(!err, "tweaked config is valid JSON");
  const auto* addrs = preflight::jsonlite::find_object(doc, "Addresses");
  expect(addrs != nullptr, "Addresses kept");
  expect(preflight::jsonlite::get_string(*addrs, "API") == "/ip4/127.0.0.1/tcp/0", "API port zero");
  expect(preflight::jsonlite::get_string(*addrs, "Gateway", "x").empty(), "Gateway disabled");
  const auto swarm = preflight::jsonlite::get_string_array(*addrs, "Swarm");
  expect(swarm.size() == 1 && swarm[0] == "/ip4/0.0.0.0/tcp/0", "Swarm port zero");
  expect(preflight::jsonlite::find_array(*addrs, "Announce") != nullptr, "unknown Addresses key kept");

  const auto* discovery = preflight::jsonlite::find_object(doc, "Discovery");
  const auto* mdns = discovery ? preflight::jsonlite::find_object(*discovery, "MDNS") : nullptr;
  expect(mdns != nullptr, "MDNS kept");
  expect(!preflight::jsonlite::get_bool(*mdns, "Enabled", true), "MDNS disabled");
  expect(mdns->count("Interval") == 1, "unknown MDNS key kept");

  const auto* identity = preflight::jsonlite::find_object(doc, "Identity");
  expect(identity && preflight::jsonlite::get_string(*identity, "PeerID") == "QmPeer\xc3\xa9",
         "unknown top-level object kept");
  const auto* datastore = preflight::jsonlite::find_object(doc, "Datastore");
  expect(datastore && preflight::jsonlite::get_string(*datastore, "StorageMax") == "10GB",
         "Datastore kept");
  fs::remove_all(home);
}

void test_tweak_config_idempotent() {
  const fs::path home = fresh_dir("tweak_twice");
  write_file(home / preflight::kConfigFileName, kNodeConfig);
  expect(!preflight::tweak_config(home.string()), "first tweak");
  const std::string once = read_file(home / preflight::kConfigFileName);
  expect(!preflight::tweak_config(home.string()), "second tweak");
  expect(read_file(home / preflight::kConfigFileName) == once, "second tweak changes nothing");
  fs::remove_all(home);
}

void test_tweak_config_missing_addresses() {
  const fs::path home = fresh_dir("tweak_noaddr");
  const std::string original = R"({"Discovery":{"MDNS":{"Enabled":true}}})";
  write_file(home / preflight::kConfigFileName, original);
  const auto err = preflight::tweak_config(home.string());
  expect(err.has_value(), "missing Addresses fails");
  expect(err->code == preflight::ErrorCode::config_invalid, "config_invalid code");
  expect(err->message.find("no addresses field") != std::string::npos, "descriptive message");
  expect(read_file(home / preflight::kConfigFileName) == original, "file not rewritten");
  fs::remove_all(home);
}

void test_tweak_config_bad_documents() {
  preflight::jsonlite::Object no_mdns;
  no_mdns["Discovery"] = preflight::jsonlite::Value(preflight::jsonlite::Object{});
  no_mdns["Addresses"] = preflight::jsonlite::Value(preflight::jsonlite::Object{});
  auto err = preflight::tweak_config_document(no_mdns);
  expect(err && err->code == preflight::ErrorCode::config_invalid, "missing MDNS rejected");
  expect(err->message.find("Discovery.MDNS") != std::string::npos, "message names the key");

  preflight::jsonlite::Object wrong_type;
  wrong_type["Discovery"] = preflight::jsonlite::Value("off");
  err = preflight::tweak_config_document(wrong_type);
  expect(err && err->code == preflight::ErrorCode::config_invalid, "wrong-typed Discovery rejected");

  const fs::path home = fresh_dir("tweak_badjson");
  write_file(home / preflight::kConfigFileName, "{\"Addresses\":");
  err = preflight::tweak_config(home.string());
  expect(err && err->code == preflight::ErrorCode::json_parse_error, "malformed JSON rejected");
  err = preflight::tweak_config((home / "absent").string());
  expect(err && err->code == preflight::ErrorCode::io_error, "unreadable config rejected");
  fs::remove_all(home);
}

void test_staging_area_lifecycle() {
  const fs::path root = fresh_dir("staging") / "update-staging";
  std::string path;
  {
    std::optional<preflight::Error> err;
    auto area = preflight::StagingArea::create(root.string(), "test", &err);
    expect(area != nullptr && !err, "staging area created");
    path = area->path();
    expect(fs::is_directory(path), "directory exists");
    expect(fs::path(path).parent_path() == root, "created under the root");
    expect(fs::path(path).filename().string().rfind("test", 0) == 0, "prefix applied");

    std::optional<preflight::Error> err2;
    auto other = preflight::StagingArea::create(root.string(), "test", &err2);
    expect(other && other->path() != path, "never reused across runs");
    write_file(fs::path(path) / "config", "{}");
  }
  expect(!fs::exists(path), "destructor removes the directory");
  expect(dir_is_empty(root), "every staging area removed");

  std::optional<preflight::Error> err;
  auto area = preflight::StagingArea::create(root.string(), "test", &err);
  expect(!area->release(), "release succeeds");
  expect(area->released() && !fs::exists(area->path()), "release removes");
  expect(!area->release(), "second release is a no-op");
  fs::remove_all(root.parent_path());
}

// ============================================================================
// Process primitives
// ============================================================================

void test_run_command_combined_output() {
  preflight::CommandSpec spec;
  spec.program = "/bin/sh";
  spec.argv = {"-c", "echo out; echo err 1>&2; exit 3"};
  const auto r = preflight::run_command(spec);
  expect(r.spawned, "spawned");
  expect(r.exit_code == 3, "exit code propagated");
  expect(!r.ok(), "non-zero exit is not ok");
  expect(r.output.find("out\n") != std::string::npos && r.output.find("err\n") != std::string::npos,
         "stdout and stderr combined");
  expect(r.error_message == "exit status 3", "exit status message");
}

void test_run_command_env_and_stdin() {
  preflight::CommandSpec spec;
  spec.program = "/bin/sh";
  spec.argv = {"-c", "read x; echo \"$x:$IPFS_PATH:${HOME:-unset}\""};
  spec.env = {{"IPFS_PATH", "/sandbox"}};
  spec.stdin_data = "payload\n";
  const auto r = preflight::run_command(spec);
  expect(r.ok(), "command ok");
  expect(r.output == "payload:/sandbox:unset\n", "stdin fed and environment restricted");
}

void test_run_command_timeout_and_spawn_failure() {
  preflight::CommandSpec spec;
  spec.program = "/bin/sh";
  spec.argv = {"-c", "exec /bin/sleep 5"};
  spec.timeout_ms = 100;
  const auto start = std::chrono::steady_clock::now();
  const auto r = preflight::run_command(spec);
  expect(r.timed_out && r.exit_code == 124, "timeout reported");
  expect(std::chrono::steady_clock::now() - start < 3s, "timeout enforced");

  preflight::CommandSpec missing;
  missing.program = "/nonexistent/preflight-bin";
  const auto m = preflight::run_command(missing);
  expect(!m.spawned && !m.error_message.empty(), "spawn failure reported");
}

void test_managed_process_double_close() {
  const fs::path dir = fresh_dir("proc_close");
  preflight::DaemonSpec spec;
  spec.program = "/bin/sleep";
  spec.argv = {"30"};
  spec.stdout_path = (dir / "out").string();
  spec.stderr_path = (dir / "err").string();

  std::optional<preflight::Error> err;
  auto proc = preflight::ManagedProcess::spawn(spec, &err);
  expect(proc != nullptr && !err, "spawned");
  expect(proc->pid() > 0 && proc->running(), "running");
  expect(fs::exists(dir / "out") && fs::exists(dir / "err"), "stream files created");
  expect(!proc->close(), "first close succeeds");
  expect(proc->closed() && !proc->running(), "closed");
  expect(!proc->close(), "second close is a guarded no-op");
  fs::remove_all(dir);
}

void test_managed_process_stream_file_failure() {
  preflight::DaemonSpec spec;
  spec.program = "/bin/sleep";
  spec.argv = {"30"};
  spec.stdout_path = "/nonexistent-dir/daemon.stdout";
  spec.stderr_path = "/nonexistent-dir/daemon.stderr";
  std::optional<preflight::Error> err;
  auto proc = preflight::ManagedProcess::spawn(spec, &err);
  expect(proc == nullptr, "nothing spawned");
  expect(err && err->code == preflight::ErrorCode::io_error, "io_error reported");
}

// ============================================================================
// Process Supervisor
// ============================================================================

void test_linear_backoff_shape() {
  std::vector<std::chrono::milliseconds> sleeps;
  auto record = [&](std::chrono::milliseconds d) { sleeps.push_back(d); };

  int calls = 0;
  auto outcome = preflight::poll_with_linear_backoff(
      15, 100ms, [&](int) { ++calls; return preflight::PollOutcome::pending; }, record);
  expect(outcome == preflight::PollOutcome::pending, "budget exhausted");
  expect(calls == 15, "every attempt probed");
  expect(sleeps.size() == 14, "no sleep after the final attempt");
  for (size_t i = 0; i < sleeps.size(); ++i) {
    expect(sleeps[i] == 100ms * static_cast<int>(i + 1), "delay grows linearly");
  }

  sleeps.clear();
  outcome = preflight::poll_with_linear_backoff(
      10, 100ms,
      [](int i) { return i == 3 ? preflight::PollOutcome::ready : preflight::PollOutcome::pending; },
      record);
  expect(outcome == preflight::PollOutcome::ready, "ready stops early");
  expect(sleeps.size() == 3 && sleeps[2] == 300ms, "three sleeps before success");

  sleeps.clear();
  outcome = preflight::poll_with_linear_backoff(
      10, 100ms, [](int) { return preflight::PollOutcome::failed; }, record);
  expect(outcome == preflight::PollOutcome::failed && sleeps.empty(), "hard failure stops at once");
}

void test_endpoint_from_api_file() {
  using preflight::endpoint_from_api_file;
  expect(endpoint_from_api_file("/ip4/127.0.0.1/tcp/5002") == std::string("localhost:5002"),
         "multiaddr port");
  expect(endpoint_from_api_file("/ip4/127.0.0.1/tcp/43121\n") == std::string("localhost:43121"),
         "trailing newline ignored");
  expect(!endpoint_from_api_file("/ip4/127.0.0.1/tcp/"), "empty port pending");
  expect(!endpoint_from_api_file("/ip4/127.0.0.1/tcp/abc"), "non-numeric port");
  expect(!endpoint_from_api_file("/ip4/127.0.0.1/tcp/99999"), "out of range port");
}

void test_wait_for_api_reads_api_file() {
  const fs::path home = fresh_dir("api_file");
  TestListener listener;
  write_file(home / preflight::kApiFileName, "/ip4/127.0.0.1/tcp/" + std::to_string(listener.port));

  preflight::PollPolicy policy;
  policy.base_interval = 1ms;
  policy.fallback_endpoint = "127.0.0.1:1";
  std::string endpoint;
  expect(!preflight::wait_for_api(home.string(), policy, &endpoint), "daemon reachable");
  expect(endpoint == "localhost:" + std::to_string(listener.port), "endpoint from api file");
  fs::remove_all(home);
}

void test_wait_for_api_legacy_fallback() {
  const fs::path home = fresh_dir("api_fallback");
  TestListener listener;
  preflight::PollPolicy policy;
  policy.base_interval = 1ms;
  policy.fallback_endpoint = "127.0.0.1:" + std::to_string(listener.port);
  std::string endpoint;
  expect(!preflight::wait_for_api(home.string(), policy, &endpoint), "fallback reachable");
  expect(endpoint == policy.fallback_endpoint, "fallback endpoint used");
  fs::remove_all(home);
}

void test_wait_for_api_malformed_file_skips_fallback() {
  const fs::path home = fresh_dir("api_malformed");
  TestListener listener;
  write_file(home / preflight::kApiFileName, "/ip4/127.0.0.1/tcp/notaport");

  preflight::PollPolicy policy;
  policy.base_interval = 1ms;
  // Something unrelated answers on the legacy endpoint.
  policy.fallback_endpoint = "127.0.0.1:" + std::to_string(listener.port);
  std::string endpoint;
  const auto err = preflight::wait_for_api(home.string(), policy, &endpoint);
  expect(err.has_value(), "readiness fails");
  expect(err->code == preflight::ErrorCode::daemon_offline, "daemon_offline code");
  expect(err->message.find("failed to come online") != std::string::npos, "message");
  expect(err->message.find("notaport") != std::string::npos, "file contents attached");
  expect(endpoint.empty(), "legacy endpoint never reported");
  fs::remove_all(home);
}

void test_start_daemon_never_online() {
  const fs::path dir = fresh_dir("never_online");
  const fs::path home = dir / "home";
  fs::create_directories(home);
  preflight::DaemonLaunch launch;
  launch.binary = write_script(dir, "sleeper", "exec /bin/sleep 30").string();
  launch.home = home.string();
  launch.poll.base_interval = 1ms;
  launch.poll.fallback_endpoint = "127.0.0.1:1";

  preflight::DaemonHandle handle;
  const auto start = std::chrono::steady_clock::now();
  const auto err = preflight::start_daemon(launch, &handle);
  expect(err.has_value(), "readiness failure reported");
  expect(err->code == preflight::ErrorCode::daemon_offline, "daemon_offline code");
  expect(err->message.find("failed to come online") != std::string::npos, "message");
  expect(std::chrono::steady_clock::now() - start < 10s, "bounded by the attempt budget");
  expect(handle.process == nullptr, "no handle escapes a failed start");
  expect(fs::exists(home / preflight::kDaemonStdoutName), "stdout file created");
  expect(fs::exists(home / preflight::kDaemonStderrName), "stderr file created");
  fs::remove_all(dir);
}

// ============================================================================
// Smoke Test Suite
// ============================================================================

void test_smoke_helpers() {
  expect(preflight::expected_version_line("v0.5.0") == "ipfs version 0.5.0", "expected literal");
  expect(!preflight::daemon_checks_supported("v0.3.5"), "v0.3.5 skips daemon checks");
  expect(!preflight::daemon_checks_supported("v0.3.7"), "v0.3.7 skips daemon checks");
  expect(preflight::daemon_checks_supported("v0.3.8"), "v0.3.8 runs daemon checks");
  expect(preflight::daemon_checks_supported("v0.4.0"), "v0.4.0 runs daemon checks");
}

void test_smoke_one_shot_checks() {
  const fs::path dir = fresh_dir("smoke");
  preflight::SmokeContext ctx;
  ctx.binary = make_candidate(dir, "0.5.0").string();
  ctx.home = (dir / "home").string();
  ctx.timeout_ms = 20000;
  expect(!preflight::check_init(ctx), "init succeeds");
  expect(fs::exists(fs::path(ctx.home) / preflight::kConfigFileName), "config written");
  expect(!preflight::check_version(ctx, "v0.5.0"), "version matches");
  const auto mismatch = preflight::check_version(ctx, "v0.6.0");
  expect(mismatch && mismatch->code == preflight::ErrorCode::version_mismatch, "mismatch detected");

  const auto again = preflight::check_init(ctx);
  expect(again && again->code == preflight::ErrorCode::command_failed, "second init fails");
  expect(again->message.find("already exists") != std::string::npos, "output attached to error");
  fs::remove_all(dir);
}

// ============================================================================
// Validation Orchestrator (end to end)
// ============================================================================

void test_e2e_full_validation() {
  const fs::path dir = fresh_dir("e2e_full");
  const auto bin = make_candidate(dir, "0.5.0");
  std::ostringstream logs;
  preflight::log::set_sink(&logs);
  const auto report = preflight::validate_candidate({bin.string(), "v0.5.0"}, e2e_config(dir));
  preflight::log::set_sink(nullptr);

  expect(report.ok, "validation succeeds: " + (report.error ? report.error->message : ""));
  expect(!report.error && report.failed_step.empty(), "no error");
  expect(!report.daemon_checks_skipped, "daemon checks ran");
  expect(contains(report.completed_steps, "round_trip"), "round trip ran");
  expect(contains(report.completed_steps, "refs_local"), "refs local ran");
  expect(report.api_endpoint.rfind("localhost:", 0) == 0, "endpoint recorded");
  expect(report.candidate_digest == preflight::hash_file_blake3_hex(bin.string()),
         "candidate fingerprint recorded");
  expect(!report.staging_dir.empty() && !fs::exists(report.staging_dir), "staging removed");
  expect(dir_is_empty(dir / "staging"), "nothing left under the staging root");
  expect(logs.str().find("success!") != std::string::npos, "terminal success line");
  expect(logs.str().find("ERROR") == std::string::npos, "no errors logged");
  fs::remove_all(dir);
}

void test_e2e_legacy_version_skips_daemon() {
  const fs::path dir = fresh_dir("e2e_legacy");
  // A daemon start would fail: no api file and nothing listening.
  const auto bin = make_candidate(dir, "0.3.5", "--fake-no-listen");
  const fs::path events = dir / "events.jsonl";
  preflight::log::set_event_log(events.string());
  const auto report = preflight::validate_candidate({bin.string(), "v0.3.5"}, e2e_config(dir));
  preflight::log::set_event_log("");

  expect(report.ok, "validation succeeds");
  expect(report.daemon_checks_skipped, "daemon checks skipped");
  expect(contains(report.completed_steps, "check_version"), "version checked");
  expect(!contains(report.completed_steps, "start_daemon"), "daemon never started");
  expect(!fs::exists(report.staging_dir), "staging removed");

  std::istringstream lines(read_file(events));
  std::vector<std::string> steps;
  for (std::string line; std::getline(lines, line);) {
    std::optional<preflight::jsonlite::JsonError> err;
    const auto ev = preflight::jsonlite::parse(line, &err);
    expect(!err, "event line is JSON");
    steps.push_back(preflight::jsonlite::get_string(ev, "step"));
  }
  expect(contains(steps, "run_init") && contains(steps, "version_gate"), "step events emitted");
  expect(!steps.empty() && steps.back() == "cleanup", "cleanup event last");
  expect(!contains(steps, "stop_daemon"), "no daemon to stop");
  fs::remove_all(dir);
}

void test_e2e_version_mismatch() {
  const fs::path dir = fresh_dir("e2e_mismatch");
  const auto bin = make_candidate(dir, "0.4.9");
  std::ostringstream logs;
  preflight::log::set_sink(&logs);
  const auto report = preflight::validate_candidate({bin.string(), "v0.5.0"}, e2e_config(dir));
  preflight::log::set_sink(nullptr);

  expect(!report.ok, "validation fails");
  expect(report.failed_step == "check_version", "fails at the version step");
  expect(report.error && report.error->code == preflight::ErrorCode::version_mismatch,
         "version_mismatch code");
  expect(!contains(report.completed_steps, "start_daemon"), "daemon never started");
  expect(!report.staging_dir.empty() && !fs::exists(report.staging_dir), "staging removed");
  expect(logs.str().find("success!") == std::string::npos, "no success line on failure");
  fs::remove_all(dir);
}

void test_e2e_init_failure() {
  const fs::path dir = fresh_dir("e2e_init");
  const auto bin = make_candidate(dir, "0.5.0", "--fake-fail-init");
  std::ostringstream logs;
  preflight::log::set_sink(&logs);
  const auto report = preflight::validate_candidate({bin.string(), "v0.5.0"}, e2e_config(dir));
  preflight::log::set_sink(nullptr);

  expect(report.failed_step == "run_init", "fails at init");
  expect(report.error && report.error->message.find("failed to generate identity") != std::string::npos,
         "combined output attached");
  expect(!fs::exists(report.staging_dir), "staging removed");
  fs::remove_all(dir);
}

void test_e2e_daemon_never_online() {
  const fs::path dir = fresh_dir("e2e_offline");
  const auto bin = make_candidate(dir, "0.5.0", "--fake-no-listen");
  auto config = e2e_config(dir);
  config.poll.base_interval = 2ms;
  std::ostringstream logs;
  preflight::log::set_sink(&logs);
  const auto report = preflight::validate_candidate({bin.string(), "v0.5.0"}, config);
  preflight::log::set_sink(nullptr);

  expect(report.failed_step == "start_daemon", "fails at daemon start");
  expect(report.error && report.error->code == preflight::ErrorCode::daemon_offline,
         "daemon_offline code");
  expect(!fs::exists(report.staging_dir), "staging removed after the daemon was stopped");
  fs::remove_all(dir);
}

void test_e2e_round_trip_mismatch() {
  const fs::path dir = fresh_dir("e2e_badcat");
  const auto bin = make_candidate(dir, "0.5.0", "--fake-bad-cat");
  const fs::path events = dir / "events.jsonl";
  std::ostringstream logs;
  preflight::log::set_sink(&logs);
  preflight::log::set_event_log(events.string());
  const auto report = preflight::validate_candidate({bin.string(), "v0.5.0"}, e2e_config(dir));
  preflight::log::set_event_log("");
  preflight::log::set_sink(nullptr);

  expect(report.failed_step == "round_trip", "fails at the round trip");
  expect(report.error && report.error->code == preflight::ErrorCode::smoke_failed, "smoke_failed");
  expect(!contains(report.completed_steps, "refs_local"), "fail fast");
  expect(!fs::exists(report.staging_dir), "staging removed");

  const std::string log_text = read_file(events);
  const auto stop = log_text.find("\"step\":\"stop_daemon\"");
  const auto cleanup = log_text.find("\"step\":\"cleanup\"");
  expect(stop != std::string::npos && cleanup != std::string::npos && stop < cleanup,
         "daemon stopped before the staging area is removed");
  fs::remove_all(dir);
}

void test_e2e_refs_local_missing() {
  const fs::path dir = fresh_dir("e2e_refs");
  const auto bin = make_candidate(dir, "0.5.0", "--fake-missing-refs");
  const fs::path events = dir / "events.jsonl";
  std::ostringstream logs;
  preflight::log::set_sink(&logs);
  preflight::log::set_event_log(events.string());
  const auto report = preflight::validate_candidate({bin.string(), "v0.5.0"}, e2e_config(dir));
  preflight::log::set_event_log("");
  preflight::log::set_sink(nullptr);

  expect(!report.ok, "validation fails");
  expect(report.failed_step == "refs_local", "fails at the refs check");
  expect(report.error && report.error->code == preflight::ErrorCode::smoke_failed, "smoke_failed");
  expect(report.error->message.find(preflight::kSmokePayloadCid) != std::string::npos,
         "expected content id in the message");
  expect(report.error->message.find("bafkstaleblockfromanotherrepo") != std::string::npos,
         "refs output in the message");
  expect(contains(report.completed_steps, "round_trip"), "round trip passed first");
  expect(!fs::exists(report.staging_dir), "staging removed");

  const std::string log_text = read_file(events);
  const auto stop = log_text.find("\"step\":\"stop_daemon\"");
  const auto cleanup = log_text.find("\"step\":\"cleanup\"");
  expect(stop != std::string::npos && cleanup != std::string::npos && stop < cleanup,
         "daemon stopped before the staging area is removed");
  fs::remove_all(dir);
}

void test_report_json() {
  preflight::ValidationReport r;
  r.ok = false;
  r.failed_step = "check_version";
  r.error = preflight::make_error(preflight::ErrorCode::version_mismatch, "version didn't match");
  r.completed_steps = {"ensure_executable", "run_init"};
  r.duration_ns = 42;

  std::optional<preflight::jsonlite::JsonError> err;
  const auto obj = preflight::jsonlite::parse(preflight::report_to_json(r), &err);
  expect(!err, "report is JSON");
  expect(!preflight::jsonlite::get_bool(obj, "ok", true), "ok field");
  expect(preflight::jsonlite::get_string(obj, "failed_step") == "check_version", "failed_step field");
  const auto* e = preflight::jsonlite::find_object(obj, "error");
  expect(e && preflight::jsonlite::get_string(*e, "code") == "version_mismatch", "error code field");
  expect(preflight::jsonlite::get_string_array(obj, "completed_steps").size() == 2, "steps field");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_from_env() {
  ::setenv("PREFLIGHT_STAGING_ROOT", "/tmp/preflight-root", 1);
  ::setenv("PREFLIGHT_COMMAND_TIMEOUT_MS", "0", 1);
  ::setenv("PREFLIGHT_POLL_BASE_MS", "25", 1);
  ::setenv("PREFLIGHT_VERBOSE", "1", 1);
  auto c = preflight::HarnessConfig::from_env();
  expect(c.staging_root == "/tmp/preflight-root", "staging root from env");
  expect(c.command_timeout_ms == 0, "timeout from env");
  expect(c.poll.base_interval == 25ms, "poll base from env");
  expect(c.verbose, "verbose from env");
  expect(c.poll.file_attempts == 15 && c.poll.connect_attempts == 10, "attempt budgets");

  ::setenv("PREFLIGHT_POLL_BASE_MS", "fast", 1);
  ::unsetenv("PREFLIGHT_STAGING_ROOT");
  ::setenv("IPFS_PATH", "/srv/node", 1);
  c = preflight::HarnessConfig::from_env();
  expect(c.poll.base_interval == 100ms, "unparsable value keeps the default");
  expect(c.staging_root == (fs::path("/srv/node") / "update-staging").string(),
         "default staging root under the node home");

  ::unsetenv("PREFLIGHT_COMMAND_TIMEOUT_MS");
  ::unsetenv("PREFLIGHT_POLL_BASE_MS");
  ::unsetenv("PREFLIGHT_VERBOSE");
  ::unsetenv("IPFS_PATH");
}

void test_config_rejects_oversized_durations() {
  // 2^64 + 5 would wrap to 5 in a plain accumulator.
  ::setenv("PREFLIGHT_POLL_BASE_MS", "18446744073709551621", 1);
  ::setenv("PREFLIGHT_COMMAND_TIMEOUT_MS", "99999999999", 1);
  auto c = preflight::HarnessConfig::from_env();
  expect(c.poll.base_interval == 100ms, "oversized poll base keeps the default");
  expect(c.command_timeout_ms == 120000, "oversized timeout keeps the default");

  ::setenv("PREFLIGHT_COMMAND_TIMEOUT_MS", "9999999999", 1);
  c = preflight::HarnessConfig::from_env();
  expect(c.command_timeout_ms == 9999999999ULL, "ten digits accepted");

  ::unsetenv("PREFLIGHT_COMMAND_TIMEOUT_MS");
  ::unsetenv("PREFLIGHT_POLL_BASE_MS");
}

void test_error_wrapping() {
  const auto inner = preflight::make_error(preflight::ErrorCode::command_failed, "exit status 1: boom");
  const auto outer = preflight::wrap(inner, "run_init");
  expect(outer.code == preflight::ErrorCode::command_failed, "wrap keeps the code");
  expect(outer.message == "run_init: exit status 1: boom", "wrap prefixes context");
  expect(outer.describe() == "command_failed: run_init: exit status 1: boom", "describe");
}

}  // namespace

int main() {
  std::cout << "=== preflight test suite ===\n";

  std::cout << "\n[Version Comparator]\n";
  run_test("precedes ordering", test_precedes_ordering);
  run_test("precedes malformed input", test_precedes_malformed_is_false);
  run_test("semver parse", test_semver_parse);
  run_test("manifest JSON", test_manifest_json);

  std::cout << "\n[Fingerprint]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("file fingerprint", test_file_fingerprint);

  std::cout << "\n[JSON document]\n";
  run_test("round trip keeps unknown fields", test_json_round_trip_keeps_unknown_fields);
  run_test("strict parsing", test_json_strictness);
  run_test("string strictness", test_json_string_strictness);
  run_test("escape control characters", test_json_escape_control_chars);

  std::cout << "\n[Safe Remover]\n";
  run_test("missing path is a no-op", test_remove_missing_path_is_noop);
  run_test("file and tree removal", test_remove_file_and_tree);
  run_test("locked path moved aside", test_remove_falls_back_to_move);
  run_test("both tiers failing is reported", test_remove_reports_both_failures);
  run_test("fallback destination naming", test_fallback_destination_naming);
  run_test("fallback names exhausted", test_fallback_destination_exhausted);

  std::cout << "\n[Sandbox Builder]\n";
  run_test("tweak rewrites addresses", test_tweak_config_rewrites_addresses);
  run_test("tweak is idempotent", test_tweak_config_idempotent);
  run_test("missing Addresses", test_tweak_config_missing_addresses);
  run_test("bad documents", test_tweak_config_bad_documents);
  run_test("staging area lifecycle", test_staging_area_lifecycle);

  std::cout << "\n[Process primitives]\n";
  run_test("combined output", test_run_command_combined_output);
  run_test("restricted env and stdin", test_run_command_env_and_stdin);
  run_test("timeout and spawn failure", test_run_command_timeout_and_spawn_failure);
  run_test("double close", test_managed_process_double_close);
  run_test("stream file failure", test_managed_process_stream_file_failure);

  std::cout << "\n[Process Supervisor]\n";
  run_test("linear backoff shape", test_linear_backoff_shape);
  run_test("api file endpoint", test_endpoint_from_api_file);
  run_test("wait for api file", test_wait_for_api_reads_api_file);
  run_test("legacy fallback endpoint", test_wait_for_api_legacy_fallback);
  run_test("malformed api file skips fallback", test_wait_for_api_malformed_file_skips_fallback);
  run_test("never online", test_start_daemon_never_online);

  std::cout << "\n[Smoke Test Suite]\n";
  run_test("helpers", test_smoke_helpers);
  run_test("one-shot checks", test_smoke_one_shot_checks);

  std::cout << "\n[Validation Orchestrator]\n";
  run_test("full validation (v0.5.0)", test_e2e_full_validation);
  run_test("legacy skip (v0.3.5)", test_e2e_legacy_version_skips_daemon);
  run_test("version mismatch", test_e2e_version_mismatch);
  run_test("init failure", test_e2e_init_failure);
  run_test("daemon never online", test_e2e_daemon_never_online);
  run_test("round trip mismatch", test_e2e_round_trip_mismatch);
  run_test("refs local missing content", test_e2e_refs_local_missing);
  run_test("report JSON", test_report_json);

  std::cout << "\n[Configuration & errors]\n";
  run_test("config from env", test_config_from_env);
  run_test("oversized durations rejected", test_config_rejects_oversized_durations);
  run_test("error wrapping", test_error_wrapping);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
