#include "platform.h"

namespace husk::platform {

std::error_code remove_all_with_retry(std::filesystem::path const &target) {
  // Windows antivirus (Defender) and Search indexer often hold file handles
  // briefly after files are created. Retry with exponential backoff.
  constexpr int kMaxRetries{ 6 };
  constexpr int kInitialDelayMs{ 50 };

  std::error_code ec;
  for (int attempt{ 0 }; attempt < kMaxRetries; ++attempt) {
    std::filesystem::remove_all(target, ec);
    if (!ec) { return ec; }

    // ERROR_SHARING_VIOLATION (32) and ERROR_LOCK_VIOLATION (33) are the
    // typical errors when another process has the file/directory open.
    // Also handle ERROR_ACCESS_DENIED (5) which can occur during AV scans.
    DWORD const win_err{ static_cast<DWORD>(ec.value()) };
    bool const retryable{ win_err == ERROR_SHARING_VIOLATION ||
                          win_err == ERROR_LOCK_VIOLATION ||
                          win_err == ERROR_ACCESS_DENIED };
    if (!retryable) { break; }

    // Exponential backoff: 50, 100, 200, 400, 800, 1600ms
    int const delay_ms{ kInitialDelayMs << attempt };
    ::Sleep(static_cast<DWORD>(delay_ms));
  }

  return ec;
}

}  // namespace husk::platform
