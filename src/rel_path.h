#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace husk {

// '/'-separated path relative to a tree root, with no "." or ".." components and no
// leading or trailing separator. The empty string names the root itself.
using rel_path = std::string;

// Lexically relativize `p` against `root`. Returns nullopt when `p` lies outside it.
std::optional<rel_path> rel_path_from(std::filesystem::path const &root,
                                      std::filesystem::path const &p);

// Resolve `child` (as written in a manifest) against directory `dir`. Returns nullopt
// for absolute paths and paths that climb above the tree root.
std::optional<rel_path> rel_path_join(rel_path const &dir, std::string_view child);

rel_path rel_path_parent(rel_path const &p);
std::string_view rel_path_filename(rel_path const &p);

// Every proper ancestor directory of `p`, outermost first: "a/b/c" -> {"a", "a/b"}.
std::vector<rel_path> rel_path_ancestors(rel_path const &p);

std::filesystem::path rel_path_to_fs(std::filesystem::path const &root,
                                     rel_path const &p);

}  // namespace husk
