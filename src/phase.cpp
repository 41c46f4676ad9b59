#include "phase.h"

#include <array>

namespace husk {

namespace {

// Enum-to-string mapping (order must match phase enum in phase.h)
constinit std::array<std::string_view, 5> const phase_name_table{{
    "discover",        // phase::discover
    "sanitize",        // phase::sanitize
    "filter_collect",  // phase::filter_collect
    "filter_select",   // phase::filter_select
    "assemble",        // phase::assemble
}};

}  // namespace

std::string_view phase_name(phase p) {
  return phase_name_table[static_cast<std::size_t>(p)];
}

}  // namespace husk
