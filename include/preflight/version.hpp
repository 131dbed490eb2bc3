#pragma once

// preflight/version.hpp: Candidate version ordering and the harness manifest.
//
// VERSION SHAPE:
//   Candidate versions are "v<int>.<int>.<int>". precedes() is deliberately
//   conservative: anything it cannot parse "does not precede", so a malformed
//   or unknown version never switches on legacy skip logic.

#include <cstdint>
#include <optional>
#include <string>

namespace preflight {
namespace version {

// Harness release, reported by `preflight version`.
constexpr const char* HARNESS_SEMVER = "0.1.0";

// First node release that binds port 0 and writes its api file. Candidates
// strictly older than this skip every daemon-mode check.
constexpr const char* PORT_ZERO_MIN_VERSION = "v0.3.8";

struct SemVer {
  std::int64_t major{0};
  std::int64_t minor{0};
  std::int64_t patch{0};
};

// Strip one leading 'v' (if any), split on '.', require exactly three
// decimal components. nullopt on any deviation.
std::optional<SemVer> parse(const std::string& text);

// True iff `a` is strictly older than `b`. Parse failure on either side: false.
bool precedes(const std::string& a, const std::string& b);

// "v0.5.0" -> "0.5.0". Input without a leading 'v' is returned unchanged.
std::string strip_v(const std::string& text);

struct HarnessManifest {
  std::string harness_semver{HARNESS_SEMVER};
  std::string port_zero_min_version{PORT_ZERO_MIN_VERSION};
  std::string hash_primitive{"blake3"};
  std::string hash_library_version;
  std::string build_timestamp;
};

HarnessManifest current_manifest();
std::string manifest_to_json(const HarnessManifest& m);

}  // namespace version
}  // namespace preflight
