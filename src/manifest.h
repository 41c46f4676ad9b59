#pragma once

#include "rel_path.h"

#include "toml++/toml.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace husk {

enum class target_kind { library, binary, example, test, benchmark, build_script };

std::string_view target_kind_name(target_kind kind);

struct target {
  target_kind kind;
  std::string name;
  std::optional<std::string> explicit_path;  // as written in the manifest
  rel_path resolved_path;                     // relative to the tree root

  bool operator==(target const &) const = default;
};

// Manifest without package identity; only aggregates member projects.
struct workspace_root {
  std::vector<std::string> members;

  bool operator==(workspace_root const &) const = default;
};

struct package_root {
  std::string name;
  std::vector<target> targets;  // every target that receives a stub

  bool operator==(package_root const &) const = default;
};

using manifest_role = std::variant<workspace_root, package_root>;

struct manifest_file {
  rel_path path;
  toml::table document;
};

struct sanitized_manifest {
  rel_path path;
  manifest_role role;
  toml::table document;  // retained fields only; this is what gets written

  bool operator==(sanitized_manifest const &other) const {
    return path == other.path && role == other.role && document == other.document;
  }
};

// Directory containing the manifest, relative to the tree root.
rel_path manifest_dir(rel_path const &manifest_path);

// Read and parse a manifest. Throws manifest_format_error naming the manifest on
// read or parse failure.
manifest_file manifest_load(std::filesystem::path const &root, rel_path const &rel);
manifest_file manifest_parse(std::string_view text, rel_path const &rel);

std::string manifest_serialize(toml::table const &document);

}  // namespace husk
