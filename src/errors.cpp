#include "errors.h"

#include <utility>

namespace husk {

error::error(std::string const &message, std::filesystem::path path)
    : std::runtime_error{ message + ": " + path.string() }, path_{ std::move(path) } {}

}  // namespace husk
