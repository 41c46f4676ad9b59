#include "errors.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

TEST_CASE("error message names the offending path") {
  husk::manifest_format_error const e{ "expected a table", "crates/a/Cargo.toml" };
  CHECK(std::string{ e.what() } == "expected a table: crates/a/Cargo.toml");
  CHECK(e.path() == std::filesystem::path{ "crates/a/Cargo.toml" });
}

TEST_CASE("error kinds share a catchable base") {
  CHECK_THROWS_AS(throw husk::traversal_error("denied", "/src"), husk::error);
  CHECK_THROWS_AS(throw husk::path_collision_error("claimed twice", "a/build.rs"),
                  husk::error);
  CHECK_THROWS_AS(throw husk::io_error("disk full", "/out"), std::runtime_error);
}
