#pragma once

#include <string>
#include <string_view>

namespace preflight {

// BLAKE3-256 of an in-memory payload, 64-char lowercase hex.
std::string blake3_hex(std::string_view payload);

// Stream-hash a file in 64 KB chunks. Returns "" if the file cannot be read.
// Used to fingerprint the candidate binary so the file that was validated can
// be matched against the file that is promoted.
std::string hash_file_blake3_hex(const std::string& path);

// Runtime BLAKE3 library version (blake3_version()).
std::string blake3_library_version();

}  // namespace preflight
