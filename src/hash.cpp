#include "preflight/hash.hpp"

#include <cstdio>
#include <fstream>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace preflight {
namespace {

class Digest {
 public:
  Digest() { blake3_hasher_init(&state_); }

  void update(const void* data, std::size_t len) { blake3_hasher_update(&state_, data, len); }

  std::string hex() {
    unsigned char raw[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&state_, raw, sizeof(raw));
    std::string text(sizeof(raw) * 2, '0');
    for (std::size_t i = 0; i < sizeof(raw); ++i) {
      std::snprintf(&text[i * 2], 3, "%02x", raw[i]);
    }
    return text;
  }

 private:
  blake3_hasher state_;
};

}  // namespace

std::string blake3_hex(std::string_view payload) {
  Digest d;
  d.update(payload.data(), payload.size());
  return d.hex();
}

std::string hash_file_blake3_hex(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return "";

  Digest d;
  std::vector<char> chunk(64 * 1024);
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (in.gcount() > 0) d.update(chunk.data(), static_cast<std::size_t>(in.gcount()));
  }
  // eof is the normal exit; badbit means the read itself failed.
  if (in.bad()) return "";
  return d.hex();
}

std::string blake3_library_version() { return blake3_version(); }

}  // namespace preflight
