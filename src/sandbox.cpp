#include "preflight/sandbox.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include "preflight/log.hpp"
#include "preflight/remove.hpp"

namespace fs = std::filesystem;

namespace preflight {

namespace {

std::uint64_t random_suffix() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint32_t> dist;
  return dist(rng);
}

// Write to a sibling temp file, then rename over the target so a reader never
// sees a half-written config.
std::optional<Error> atomic_write(const fs::path& target, const std::string& data) {
  const fs::path tmp = target.parent_path() / (".tmp_" + std::to_string(random_suffix()));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      return make_error(ErrorCode::config_write_failed, "cannot open " + tmp.string());
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::remove(tmp.string().c_str());
      return make_error(ErrorCode::config_write_failed, "short write to " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.string().c_str());
    return make_error(ErrorCode::config_write_failed,
                      "replacing " + target.string() + ": " + ec.message());
  }
  return std::nullopt;
}

}  // namespace

std::optional<Error> tweak_config_document(jsonlite::Object& doc) {
  jsonlite::Object* discovery = jsonlite::find_object(doc, "Discovery");
  if (!discovery) {
    return make_error(ErrorCode::config_invalid, "config field Discovery is missing or not an object");
  }
  jsonlite::Object* mdns = jsonlite::find_object(*discovery, "MDNS");
  if (!mdns) {
    return make_error(ErrorCode::config_invalid,
                      "config field Discovery.MDNS is missing or not an object");
  }

  auto addr_it = doc.find("Addresses");
  if (addr_it == doc.end()) {
    return make_error(ErrorCode::config_invalid, "no addresses field in config");
  }
  if (!addr_it->second.is_object()) {
    return make_error(ErrorCode::config_invalid, "config field Addresses is not an object");
  }
  auto& addresses = std::get<jsonlite::Object>(addr_it->second.v);

  (*mdns)["Enabled"] = jsonlite::Value(false);
  addresses["API"] = jsonlite::Value(kSandboxApiAddr);
  addresses["Gateway"] = jsonlite::Value(kSandboxGatewayAddr);
  addresses["Swarm"] = jsonlite::Value(jsonlite::Array{jsonlite::Value(kSandboxSwarmAddr)});
  return std::nullopt;
}

std::optional<Error> tweak_config(const std::string& home) {
  const fs::path cfg_path = fs::path(home) / kConfigFileName;

  std::ifstream in(cfg_path, std::ios::binary);
  if (!in) {
    return make_error(ErrorCode::io_error, "cannot read " + cfg_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  in.close();

  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object doc = jsonlite::parse(ss.str(), &jerr);
  if (jerr) {
    return make_error(ErrorCode::json_parse_error,
                      cfg_path.string() + ": " + jerr->code + ": " + jerr->message);
  }

  if (auto err = tweak_config_document(doc)) return err;

  log::verbose("  - rewriting " + cfg_path.string());
  return atomic_write(cfg_path, jsonlite::serialize(jsonlite::Value(std::move(doc)), 2) + "\n");
}

// ---------------------------------------------------------------------------
// StagingArea
// ---------------------------------------------------------------------------

std::unique_ptr<StagingArea> StagingArea::create(const std::string& root,
                                                 const std::string& prefix,
                                                 std::optional<Error>* error) {
  if (error) error->reset();
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    if (error) {
      *error = make_error(ErrorCode::staging_failed, "creating " + root + ": " + ec.message());
    }
    return nullptr;
  }

  for (int attempt = 0; attempt < 10000; ++attempt) {
    const fs::path candidate = fs::path(root) / (prefix + std::to_string(random_suffix()));
    if (fs::create_directory(candidate, ec)) {
      return std::unique_ptr<StagingArea>(new StagingArea(candidate.string()));
    }
    if (ec) {
      if (error) {
        *error = make_error(ErrorCode::staging_failed,
                            "creating " + candidate.string() + ": " + ec.message());
      }
      return nullptr;
    }
    // create_directory() returned false without error: name taken, try again.
  }
  if (error) {
    *error = make_error(ErrorCode::staging_failed, "no free staging name under " + root);
  }
  return nullptr;
}

StagingArea::~StagingArea() {
  if (auto err = release()) {
    log::error("removing staging area: " + err->message);
  }
}

std::optional<Error> StagingArea::release() {
  if (released_) return std::nullopt;
  released_ = true;
  std::string relocated;
  if (auto err = force_remove(path_, &relocated)) return err;
  if (!relocated.empty()) {
    log::verbose("  - staging area moved to " + relocated);
  }
  return std::nullopt;
}

}  // namespace preflight
