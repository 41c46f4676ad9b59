#pragma once

#include "discovery.h"
#include "rel_path.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <unordered_set>
#include <vector>

namespace husk {

// Files that must survive verbatim, plus an index of every directory that leads to one.
// Built once (phase 1) and then only queried (phase 2).
class interesting_file_set {
 public:
  interesting_file_set() = default;
  explicit interesting_file_set(std::vector<rel_path> files);

  bool contains_file(rel_path const &p) const { return file_index_.contains(p); }
  bool contains_directory(rel_path const &p) const { return dir_index_.contains(p); }

  std::vector<rel_path> const &files() const { return files_; }
  std::size_t size() const { return files_.size(); }

 private:
  std::vector<rel_path> files_;  // sorted, unique
  std::unordered_set<rel_path> file_index_;
  std::unordered_set<rel_path> dir_index_;
};

// Phase 1: the lock file (when present inside the tree) and every discovered config.
interesting_file_set collect_interesting_files(discovery_result const &discovered,
                                               std::optional<rel_path> const &lock_file);

struct filter_result {
  std::vector<rel_path> directories;  // sorted; parents precede children
  std::vector<rel_path> files;        // sorted
};

// Phase 2: walk `root`, keeping a directory iff it is an ancestor of an interesting file
// and a file iff it is one. Pruned directories are never descended. Performs no
// discovery of its own. Throws traversal_error if a kept directory cannot be listed.
filter_result filter_tree(std::filesystem::path const &root,
                          interesting_file_set const &interesting);

}  // namespace husk
