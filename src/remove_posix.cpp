#ifndef _WIN32

#include "preflight/remove.hpp"

namespace fs = std::filesystem;

namespace preflight {

namespace {

// rename(2) within a volume; copy + delete across volumes.
class PosixRemoveStrategy final : public RemoveStrategy {
 public:
  std::error_code remove(const fs::path& path) override {
    std::error_code ec;
    fs::remove_all(path, ec);
    return ec;
  }

  std::error_code move_aside(const fs::path& from, const fs::path& to) override {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec != std::errc::cross_device_link) return ec;

    ec.clear();
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
      std::error_code cleanup;
      fs::remove_all(to, cleanup);
      return ec;
    }
    fs::remove_all(from, ec);
    return ec;
  }

  std::string strategy_id() const override { return "posix"; }
};

}  // namespace

RemoveStrategy& platform_remove_strategy() {
  static PosixRemoveStrategy strategy;
  return strategy;
}

}  // namespace preflight

#endif
