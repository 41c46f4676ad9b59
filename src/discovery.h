#pragma once

#include "rel_path.h"

#include <filesystem>
#include <string>
#include <vector>

namespace husk {

struct discovery_options {
  std::string manifest_name{ "Cargo.toml" };
  std::string config_dir{ ".cargo" };
  std::vector<std::string> config_names{ "config", "config.toml" };
  std::vector<rel_path> excluded;  // directories never descended
};

struct skipped_file {
  rel_path path;
  std::string reason;
};

struct discovery_result {
  std::vector<rel_path> manifests;  // sorted
  std::vector<rel_path> configs;    // sorted
  std::vector<skipped_file> skipped;
};

// Walk `root` once and collect every manifest and auxiliary config file beneath it.
// Throws traversal_error if the root or any directory under it cannot be listed.
// Files that match but cannot be opened are recorded in `skipped` and not returned.
discovery_result discover(std::filesystem::path const &root,
                          discovery_options const &opts = {});

}  // namespace husk
