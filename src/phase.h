#pragma once

#include <string_view>

namespace husk {

enum class phase {
  discover,
  sanitize,
  filter_collect,
  filter_select,
  assemble,
};

std::string_view phase_name(phase p);

}  // namespace husk
