#pragma once

#include <filesystem>
#include <system_error>

// Platform-specific unreachable hint. Use compiler intrinsics where available
// while remaining safe for MSVC which lacks __builtin_unreachable.
#if defined(_MSC_VER)
#define HUSK_UNREACHABLE() __assume(0)
#else
#define HUSK_UNREACHABLE() __builtin_unreachable()
#endif

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <windows.h>
#endif

namespace husk::platform {

// Remove a directory tree, retrying where the OS holds transient handles open.
std::error_code remove_all_with_retry(std::filesystem::path const &target);

}  // namespace husk::platform
