#pragma once

// preflight/remove.hpp: Two-tier path removal: delete, else move aside.
//
// CONTRACT:
//   After force_remove(path) returns nullopt the path no longer exists at that
//   location. Missing paths succeed immediately. If direct deletion fails the
//   path is relocated into the system temp directory under
//   "<YYYY.MM.DD-HH.MM.SS> <basename>". If both tiers fail the deletion error
//   and the move error are both reported; nothing is swallowed.
//
// PLATFORM STRATEGY:
//   platform_remove_strategy() is linked from remove_posix.cpp or
//   remove_win.cpp at build time. On POSIX direct deletion almost always
//   succeeds. On Windows a file held by a running process cannot be deleted,
//   so the move-aside tier (MoveFileExW with MOVEFILE_COPY_ALLOWED) is the
//   normal success path while the old binary is still executing.

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "preflight/types.hpp"

namespace preflight {

class RemoveStrategy {
 public:
  virtual ~RemoveStrategy() = default;

  // Delete path (recursively for directories).
  virtual std::error_code remove(const std::filesystem::path& path) = 0;

  // Relocate `from` to `to`, crossing volumes if the primitive allows it.
  virtual std::error_code move_aside(const std::filesystem::path& from,
                                     const std::filesystem::path& to) = 0;

  virtual std::string strategy_id() const = 0;
};

RemoveStrategy& platform_remove_strategy();

constexpr int kMaxFallbackSuffix = 1000;

// "<temp_root>/<YYYY.MM.DD-HH.MM.SS> <basename>" in local time. When that name
// is taken a "-N" suffix is appended, N up to kMaxFallbackSuffix. Returns an
// empty path when every candidate name is taken.
std::filesystem::path fallback_destination(const std::filesystem::path& path,
                                           const std::filesystem::path& temp_root,
                                           std::time_t now);

std::optional<Error> force_remove(const std::string& path,
                                  std::string* relocated_to = nullptr);

std::optional<Error> force_remove(const std::string& path,
                                  RemoveStrategy& strategy,
                                  const std::filesystem::path& temp_root,
                                  std::string* relocated_to = nullptr);

}  // namespace preflight
