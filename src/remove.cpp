#include "preflight/remove.hpp"

#include "preflight/log.hpp"

namespace fs = std::filesystem;

namespace preflight {

fs::path fallback_destination(const fs::path& path, const fs::path& temp_root,
                              std::time_t now) {
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &now);
#else
  localtime_r(&now, &tm_buf);
#endif
  char stamp[32];
  const size_t n = std::strftime(stamp, sizeof(stamp), "%Y.%m.%d-%H.%M.%S", &tm_buf);

  // "dir/" has an empty filename; fall back to the last real component.
  fs::path base = path.filename();
  if (base.empty()) base = path.parent_path().filename();

  const std::string stem = std::string(stamp, n) + " " + base.string();
  fs::path dest = temp_root / stem;
  std::error_code ec;
  for (int i = 1; i <= kMaxFallbackSuffix; ++i) {
    if (!fs::exists(fs::symlink_status(dest, ec))) return dest;
    dest = temp_root / (stem + "-" + std::to_string(i));
  }
  if (!fs::exists(fs::symlink_status(dest, ec))) return dest;
  return {};
}

std::optional<Error> force_remove(const std::string& path, RemoveStrategy& strategy,
                                  const fs::path& temp_root, std::string* relocated_to) {
  if (relocated_to) relocated_to->clear();

  std::error_code ec;
  const auto st = fs::symlink_status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return make_error(ErrorCode::remove_failed, "cannot stat " + path + ": " + ec.message());
  }
  if (!fs::exists(st)) return std::nullopt;

  const std::error_code remove_ec = strategy.remove(path);
  if (!remove_ec) return std::nullopt;

  // Typical cause: a file still mapped by a running process.
  const fs::path dest = fallback_destination(path, temp_root, std::time(nullptr));
  if (dest.empty()) {
    return make_error(ErrorCode::remove_failed,
                      "cannot remove " + path + ": " + remove_ec.message() +
                          "; no free name for it under " + temp_root.string());
  }
  log::verbose("  - cannot delete " + path + " (" + remove_ec.message() +
               "), moving it to " + dest.string());
  const std::error_code move_ec = strategy.move_aside(path, dest);
  if (move_ec) {
    return make_error(ErrorCode::remove_failed,
                      "cannot remove " + path + ": " + remove_ec.message() +
                          "; move to " + dest.string() + " failed: " + move_ec.message());
  }
  if (relocated_to) *relocated_to = dest.string();
  return std::nullopt;
}

std::optional<Error> force_remove(const std::string& path, std::string* relocated_to) {
  std::error_code ec;
  fs::path temp_root = fs::temp_directory_path(ec);
  if (ec) temp_root = fs::path(path).parent_path();
  return force_remove(path, platform_remove_strategy(), temp_root, relocated_to);
}

}  // namespace preflight
