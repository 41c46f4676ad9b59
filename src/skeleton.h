#pragma once

#include "discovery.h"
#include "rel_path.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace husk {

// What happens when one manifest fails to load or sanitize.
enum class malformed_policy {
  abort,  // fail the whole run
  skip,   // drop that manifest and everything synthesized from it
};

std::string_view malformed_policy_name(malformed_policy p);
std::optional<malformed_policy> malformed_policy_parse(std::string_view s);

struct skeleton_options {
  std::filesystem::path source;
  std::filesystem::path output;
  std::optional<std::filesystem::path> lock_file;  // default: <source>/Cargo.lock
  discovery_options discovery;
  malformed_policy on_malformed{ malformed_policy::abort };
  std::optional<std::size_t> jobs;  // caps worker threads when set
};

struct skeleton_report {
  std::size_t manifests{ 0 };  // written to the output
  std::size_t workspace_roots{ 0 };
  std::size_t configs{ 0 };
  std::size_t stubs{ 0 };
  std::size_t filtered_files{ 0 };
  std::size_t filtered_directories{ 0 };
  std::size_t unreadable_files{ 0 };
  bool lock_copied{ false };
  std::vector<rel_path> rejected_manifests;  // only populated under malformed_policy::skip
};

// Regenerate `opts.output` as the dependency-only skeleton of `opts.source`.
// Throws std::invalid_argument if the output directory is the source root or contains
// it, and otherwise any husk::error subtype for the failure it names.
skeleton_report build_skeleton(skeleton_options const &opts);

}  // namespace husk
