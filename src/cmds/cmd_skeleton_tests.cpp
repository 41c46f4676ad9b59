#include "cmds/cmd_skeleton.h"

#include "test_support.h"
#include "tui.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

using husk::test::list_files;
using husk::test::scratch_dir;
using husk::test::write_file;

namespace {

husk::cmd_skeleton::cfg cfg_for(std::filesystem::path source, std::filesystem::path output) {
  husk::cmd_skeleton::cfg c;
  c.source = std::move(source);
  c.output = std::move(output);
  return c;
}

}  // namespace

TEST_CASE("cmd_skeleton config exposes cmd_t alias") {
  CHECK(std::is_same_v<husk::cmd_skeleton::cfg::cmd_t, husk::cmd_skeleton>);
}

TEST_CASE("cmd_skeleton make_options carries flags through") {
  auto c{ cfg_for("/src", "/out") };
  c.lock_file = "/locks/Cargo.lock";
  c.on_malformed = "skip";
  c.manifest_name = "Manifest.toml";
  c.excluded = { "target", "./vendor/", "a/../third_party" };
  c.jobs = 2;

  auto const opts{ husk::cmd_skeleton::make_options(c) };
  CHECK(opts.source == std::filesystem::path{ "/src" });
  CHECK(opts.output == std::filesystem::path{ "/out" });
  REQUIRE(opts.lock_file.has_value());
  CHECK(*opts.lock_file == std::filesystem::path{ "/locks/Cargo.lock" });
  CHECK(opts.on_malformed == husk::malformed_policy::skip);
  CHECK(opts.discovery.manifest_name == "Manifest.toml");
  CHECK(opts.discovery.excluded == std::vector<husk::rel_path>{ husk::rel_path{ "target" },
                                                                 husk::rel_path{ "vendor" },
                                                                 husk::rel_path{ "third_party" } });
  REQUIRE(opts.jobs.has_value());
  CHECK(*opts.jobs == 2);
}

TEST_CASE("cmd_skeleton make_options defaults to aborting on malformed manifests") {
  auto const opts{ husk::cmd_skeleton::make_options(cfg_for("/src", "/out")) };
  CHECK(opts.on_malformed == husk::malformed_policy::abort);
  CHECK(opts.discovery.manifest_name == "Cargo.toml");
  CHECK(opts.discovery.excluded.empty());
  CHECK_FALSE(opts.jobs.has_value());
}

TEST_CASE("cmd_skeleton make_options rejects invalid values") {
  auto c{ cfg_for("/src", "/out") };

  SUBCASE("unknown policy") {
    c.on_malformed = "ignore";
    CHECK_THROWS_AS(husk::cmd_skeleton::make_options(c), std::invalid_argument);
  }

  SUBCASE("manifest name with a directory") {
    c.manifest_name = "sub/Cargo.toml";
    CHECK_THROWS_AS(husk::cmd_skeleton::make_options(c), std::invalid_argument);
  }

  SUBCASE("empty manifest name") {
    c.manifest_name = "";
    CHECK_THROWS_AS(husk::cmd_skeleton::make_options(c), std::invalid_argument);
  }

  SUBCASE("exclude escaping the source tree") {
    c.excluded = { "../sibling" };
    CHECK_THROWS_AS(husk::cmd_skeleton::make_options(c), std::invalid_argument);
  }

  SUBCASE("exclude naming the source root") {
    c.excluded = { "." };
    CHECK_THROWS_AS(husk::cmd_skeleton::make_options(c), std::invalid_argument);
  }
}

TEST_CASE("cmd_skeleton execute writes the skeleton and reports a summary") {
  scratch_dir src{ "cmd-skeleton-src" };
  scratch_dir out{ "cmd-skeleton-out" };
  write_file(src.path(), "Cargo.toml", "[package]\nname = \"app\"\n");
  write_file(src.path(), "broken/Cargo.toml", "[package\n");
  write_file(src.path(), "src/main.rs", "fn main() {}\n");

  auto c{ cfg_for(src.path(), out.path()) };
  c.on_malformed = "skip";

  std::string output;
  husk::tui::set_output_handler([&](std::string_view v) { output.append(v); });
  husk::tui::run(husk::tui::level::TUI_INFO, false);

  auto cmd{ husk::cmd::create(c) };
  cmd->execute();

  husk::tui::shutdown();
  husk::tui::set_output_handler([](std::string_view) {});

  CHECK(list_files(out.path()) ==
        std::vector<std::string>{ "Cargo.toml", "build.rs", "src/lib.rs" });
  CHECK(output.find("Excluded malformed manifest broken/Cargo.toml") != std::string::npos);
  CHECK(output.find("manifests: 1 (0 workspace roots)") != std::string::npos);
  CHECK(output.find("stubs: 2") != std::string::npos);
  CHECK(output.find("lock file: none") != std::string::npos);
}

TEST_CASE("cmd_skeleton execute propagates malformed manifests under abort") {
  scratch_dir src{ "cmd-skeleton-abort-src" };
  scratch_dir out{ "cmd-skeleton-abort-out" };
  write_file(src.path(), "Cargo.toml", "[package\n");

  auto cmd{ husk::cmd::create(cfg_for(src.path(), out.path())) };
  CHECK_THROWS(cmd->execute());
}
