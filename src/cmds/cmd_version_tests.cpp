#include "cmds/cmd_version.h"

#include "tui.h"

#include "doctest/doctest.h"

#include <string>
#include <string_view>
#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = husk::cmd_version::cfg;
  using expected_command = husk::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version reports its own and third-party versions") {
  std::string output;
  husk::tui::set_output_handler([&](std::string_view v) { output.append(v); });
  husk::tui::run(husk::tui::level::TUI_INFO, false);

  auto cmd{ husk::cmd::create(husk::cmd_version::cfg{}) };
  cmd->execute();

  husk::tui::shutdown();
  husk::tui::set_output_handler([](std::string_view) {});

  CHECK(output.find(std::string{ "husk version " } + HUSK_VERSION_STR) != std::string::npos);
  CHECK(output.find("oneTBB:") != std::string::npos);
  CHECK(output.find("toml++:") != std::string::npos);
  CHECK(output.find("CLI11:") != std::string::npos);
}
