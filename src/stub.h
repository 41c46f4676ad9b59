#pragma once

#include "manifest.h"

#include <string_view>
#include <vector>

namespace husk {

struct stub_file {
  rel_path path;         // relative to the tree root
  rel_path manifest;     // declaring manifest
  target_kind kind;
};

// Inert placeholder body shared by every stub. Compiles standalone as a library, a
// binary or a build script.
std::string_view stub_source();

// One stub per target of a package manifest; nothing for a workspace aggregator.
std::vector<stub_file> synthesize_stubs(sanitized_manifest const &m);

}  // namespace husk
