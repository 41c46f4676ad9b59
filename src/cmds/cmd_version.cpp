#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "tbb/version.h"
#include "toml++/toml.hpp"

#include <utility>

#ifndef HUSK_VERSION_STR
#error "HUSK_VERSION_STR must be defined by the build system"
#endif

namespace husk {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("husk version %s", HUSK_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());
  tui::info("  toml++: %d.%d.%d", TOML_LIB_MAJOR, TOML_LIB_MINOR, TOML_LIB_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace husk
