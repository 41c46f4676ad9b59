#include "cli.h"
#include "tui.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  husk::tui::init();

  auto args{ husk::cli_parse(argc, argv) };

  try {
    husk::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    std::fprintf(stderr, "%s\n", ex.what());
    return EXIT_FAILURE;
  }

  husk::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      husk::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    husk::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return husk::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    husk::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
