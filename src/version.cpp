#include "preflight/version.hpp"

#include <sstream>

#include "preflight/hash.hpp"
#include "preflight/jsonlite.hpp"

namespace preflight {
namespace version {

namespace {

bool parse_component(const std::string& s, std::int64_t& out) {
  if (s.empty() || s.size() > 18) return false;
  std::int64_t acc = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    acc = acc * 10 + (c - '0');
  }
  out = acc;
  return true;
}

}  // namespace

std::string strip_v(const std::string& text) {
  if (!text.empty() && text[0] == 'v') return text.substr(1);
  return text;
}

std::optional<SemVer> parse(const std::string& text) {
  const std::string body = strip_v(text);
  std::int64_t parts[3] = {0, 0, 0};
  size_t start = 0;
  for (int idx = 0; idx < 3; ++idx) {
    const size_t dot = body.find('.', start);
    const bool last = idx == 2;
    if (last != (dot == std::string::npos)) return std::nullopt;
    const std::string piece = body.substr(start, last ? std::string::npos : dot - start);
    if (!parse_component(piece, parts[idx])) return std::nullopt;
    start = dot + 1;
  }
  SemVer v;
  v.major = parts[0];
  v.minor = parts[1];
  v.patch = parts[2];
  return v;
}

bool precedes(const std::string& a, const std::string& b) {
  const auto va = parse(a);
  const auto vb = parse(b);
  if (!va || !vb) return false;
  if (va->major != vb->major) return va->major < vb->major;
  if (va->minor != vb->minor) return va->minor < vb->minor;
  return va->patch < vb->patch;
}

HarnessManifest current_manifest() {
  HarnessManifest m;
  m.hash_library_version = blake3_library_version();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const HarnessManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"harness_semver\":\"" << jsonlite::escape(m.harness_semver) << "\""
    << ",\"port_zero_min_version\":\"" << jsonlite::escape(m.port_zero_min_version) << "\""
    << ",\"hash_primitive\":\"" << jsonlite::escape(m.hash_primitive) << "\""
    << ",\"hash_library_version\":\"" << jsonlite::escape(m.hash_library_version) << "\""
    << ",\"build_timestamp\":\"" << jsonlite::escape(m.build_timestamp) << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace preflight
