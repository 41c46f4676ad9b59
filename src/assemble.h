#pragma once

#include "manifest.h"
#include "source_filter.h"
#include "stub.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace husk {

struct lock_file_copy {
  std::filesystem::path source;  // absolute, may lie outside the source tree
  rel_path destination;
};

struct assembly_plan {
  std::filesystem::path source_root;
  std::filesystem::path output_root;
  filter_result filtered;
  std::optional<lock_file_copy> lock;
  std::vector<sanitized_manifest> manifests;
  std::vector<stub_file> stubs;
};

struct assembly_report {
  std::size_t directories_created{ 0 };
  std::size_t files_written{ 0 };
};

// Throws path_collision_error if two synthesized outputs (a manifest or a stub) from
// different manifests land on the same path. Checked before anything is touched.
void assemble_check_collisions(assembly_plan const &plan);

// Remove and regenerate `plan.output_root`, overlaying in order: filtered directories
// and verbatim files, the lock file, sanitized manifests, then stubs. Later overlays
// replace earlier ones at the same path. Throws io_error on any filesystem failure.
assembly_report assemble(assembly_plan const &plan);

}  // namespace husk
