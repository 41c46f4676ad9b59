#include "test_support.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace husk::test {

namespace {

std::filesystem::path make_scratch_path(std::string_view tag) {
  static std::atomic<int> counter{ 0 };
  auto const id{ counter.fetch_add(1, std::memory_order_relaxed) };
  auto const base{ std::filesystem::temp_directory_path() };
  auto path{ base / ("husk-test-" + std::string{ tag } + "-" + std::to_string(id)) };
  std::filesystem::remove_all(path);
  std::filesystem::create_directories(path);
  return std::filesystem::weakly_canonical(path);
}

std::vector<std::string> list_entries(std::filesystem::path const &root, bool directories) {
  std::vector<std::string> result;
  for (auto const &entry : std::filesystem::recursive_directory_iterator{ root }) {
    if (directories ? entry.is_directory() : entry.is_regular_file()) {
      result.push_back(entry.path().lexically_relative(root).generic_string());
    }
  }
  std::ranges::sort(result);
  return result;
}

}  // namespace

scratch_dir::scratch_dir(std::string_view tag) : cleanup_{ make_scratch_path(tag) } {}

void write_file(std::filesystem::path const &root,
                std::string_view rel,
                std::string_view content) {
  auto const path{ root / rel };
  std::filesystem::create_directories(path.parent_path());
  util_write_file(path, content);
}

std::string read_file(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

std::vector<std::string> list_files(std::filesystem::path const &root) {
  return list_entries(root, false);
}

std::vector<std::string> list_directories(std::filesystem::path const &root) {
  return list_entries(root, true);
}

}  // namespace husk::test
