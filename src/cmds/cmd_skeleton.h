#pragma once

#include "cmd.h"
#include "skeleton.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace husk {

class cmd_skeleton : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_skeleton> {
    std::filesystem::path source;
    std::filesystem::path output;
    std::optional<std::filesystem::path> lock_file;
    std::string on_malformed{ "abort" };
    std::string manifest_name{ "Cargo.toml" };
    std::vector<std::string> excluded;
    std::optional<std::size_t> jobs;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  // Translate parsed flags into pipeline options. Throws std::invalid_argument on values
  // the parser could not reject on its own.
  static skeleton_options make_options(cfg const &c);

  explicit cmd_skeleton(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace husk
