#include "platform.h"

namespace husk::platform {

std::error_code remove_all_with_retry(std::filesystem::path const &target) {
  // On POSIX, file deletion works even with open handles (files get unlinked
  // but data persists until all handles close). No retry needed.
  std::error_code ec;
  std::filesystem::remove_all(target, ec);
  return ec;
}

}  // namespace husk::platform
