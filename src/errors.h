#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace husk {

// Base of every skeleton failure. what() is "<message>: <path>".
class error : public std::runtime_error {
 public:
  error(std::string const &message, std::filesystem::path path);

  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Source tree (or one of its directories) cannot be read. Fatal.
struct traversal_error : error {
  using error::error;
};

// One manifest is unreadable, unparseable, or structurally invalid.
struct manifest_format_error : error {
  using error::error;
};

// Two synthesized outputs resolve to the same output path. Fatal.
struct path_collision_error : error {
  using error::error;
};

// Writing the output tree failed. Fatal.
struct io_error : error {
  using error::error;
};

}  // namespace husk
