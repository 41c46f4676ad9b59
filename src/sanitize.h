#pragma once

#include "manifest.h"

namespace husk {

// Reduce a manifest to the fields that influence dependency resolution and target
// shape: package identity, every dependency table (including platform-specific ones),
// features and source overrides, profiles, target declarations and workspace
// membership. Every other key is dropped.
//
// Deterministic and idempotent: sanitize({ m.path, sanitize(m).document }) ==
// sanitize(m). Default target paths are synthesized into `role` only, never into the
// retained document.
//
// Throws manifest_format_error (naming m.path) for structurally invalid input.
sanitized_manifest sanitize(manifest_file const &m);

}  // namespace husk
