#include "source_filter.h"

#include "errors.h"
#include "trace.h"

#include "tbb/task_group.h"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <utility>

namespace husk {

namespace {

namespace fs = std::filesystem;

struct selection {
  fs::path const &root;
  interesting_file_set const &interesting;
  tbb::task_group &tg;
  std::mutex mutex;
  filter_result result;

  void visit(rel_path const &dir_rel) {
    fs::path const dir{ rel_path_to_fs(root, dir_rel) };

    std::vector<rel_path> kept_dirs;
    std::vector<rel_path> kept_files;
    std::error_code ec;
    for (fs::directory_iterator it{ dir, ec }, end; !ec && it != end; it.increment(ec)) {
      auto const &entry{ *it };
      auto const name{ entry.path().filename().string() };
      rel_path const rel{ dir_rel.empty() ? name : dir_rel + "/" + name };

      std::error_code type_ec;
      bool const is_dir{ entry.is_directory(type_ec) && !entry.is_symlink(type_ec) };
      bool const kept{ is_dir ? interesting.contains_directory(rel)
                              : (interesting.contains_file(rel) &&
                                 entry.is_regular_file(type_ec)) };
      HUSK_TRACE_FILTER_DECISION(rel, is_dir, kept);

      if (!kept) { continue; }
      (is_dir ? kept_dirs : kept_files).push_back(rel);
    }

    if (ec) { throw traversal_error("Cannot read directory (" + ec.message() + ")", dir); }

    {
      std::lock_guard lock{ mutex };
      result.directories.insert(result.directories.end(), kept_dirs.begin(), kept_dirs.end());
      result.files.insert(result.files.end(), kept_files.begin(), kept_files.end());
    }

    for (auto &sub : kept_dirs) {
      tg.run([this, sub = std::move(sub)] { visit(sub); });
    }
  }
};

}  // namespace

interesting_file_set::interesting_file_set(std::vector<rel_path> files)
    : files_{ std::move(files) } {
  std::ranges::sort(files_);
  auto const dupes{ std::ranges::unique(files_) };
  files_.erase(dupes.begin(), dupes.end());

  for (auto const &f : files_) {
    file_index_.insert(f);
    for (auto &ancestor : rel_path_ancestors(f)) { dir_index_.insert(std::move(ancestor)); }
  }
}

interesting_file_set collect_interesting_files(discovery_result const &discovered,
                                               std::optional<rel_path> const &lock_file) {
  std::vector<rel_path> files{ discovered.configs };
  if (lock_file) { files.push_back(*lock_file); }
  return interesting_file_set{ std::move(files) };
}

filter_result filter_tree(std::filesystem::path const &root,
                          interesting_file_set const &interesting) {
  tbb::task_group tg;
  selection s{ .root = root, .interesting = interesting, .tg = tg, .mutex = {}, .result = {} };

  tg.run([&s] { s.visit(rel_path{}); });
  tg.wait();

  // Lexicographic order on '/'-joined paths puts every parent before its children.
  std::ranges::sort(s.result.directories);
  std::ranges::sort(s.result.files);
  return std::move(s.result);
}

}  // namespace husk
