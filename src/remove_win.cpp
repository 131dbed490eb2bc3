#ifdef _WIN32

#include "preflight/remove.hpp"

#include <windows.h>

namespace fs = std::filesystem;

namespace preflight {

namespace {

// A running executable cannot be deleted, but it can be renamed. MoveFileExW
// with MOVEFILE_COPY_ALLOWED also crosses volumes (copy + delete).
class WindowsRemoveStrategy final : public RemoveStrategy {
 public:
  std::error_code remove(const fs::path& path) override {
    std::error_code ec;
    fs::remove_all(path, ec);
    return ec;
  }

  std::error_code move_aside(const fs::path& from, const fs::path& to) override {
    if (!MoveFileExW(from.c_str(), to.c_str(), MOVEFILE_COPY_ALLOWED)) {
      return std::error_code(static_cast<int>(GetLastError()), std::system_category());
    }
    return {};
  }

  std::string strategy_id() const override { return "windows"; }
};

}  // namespace

RemoveStrategy& platform_remove_strategy() {
  static WindowsRemoveStrategy strategy;
  return strategy;
}

}  // namespace preflight

#endif
