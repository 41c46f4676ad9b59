#include "sanitize.h"

#include "errors.h"

#include "doctest/doctest.h"

#include <string>
#include <variant>
#include <vector>

namespace {

husk::manifest_file parse(std::string_view text, husk::rel_path path = "Cargo.toml") {
  return husk::manifest_parse(text, path);
}

husk::package_root const &package_of(husk::sanitized_manifest const &m) {
  auto const *pkg{ std::get_if<husk::package_root>(&m.role) };
  REQUIRE(pkg != nullptr);
  return *pkg;
}

std::vector<husk::rel_path> target_paths(husk::sanitized_manifest const &m) {
  std::vector<husk::rel_path> paths;
  for (auto const &t : package_of(m).targets) { paths.push_back(t.resolved_path); }
  return paths;
}

constexpr std::string_view kRichManifest{ R"(
[package]
name = "engine"
version = "0.3.1"
edition = "2021"
description = "The engine"
authors = ["someone"]
license = "MIT"
readme = "README.md"
build = "tools/build.rs"

[package.metadata.docs]
all-features = true

[badges]
maintenance = { status = "actively-developed" }

[dependencies]
serde = { version = "1", features = ["derive"] }
log = "0.4"
local = { path = "../local" }

[dev-dependencies]
proptest = "1"

[build-dependencies]
cc = "1.0"

[target.'cfg(unix)'.dependencies]
libc = "0.2"

[target.'cfg(windows)']
rustflags = ["-Cfoo"]

[features]
default = ["fast"]
fast = ["serde/std"]

[patch.crates-io]
log = { git = "https://example.com/log" }

[profile.release]
lto = true

[lib]
name = "engine_core"
path = "src/core.rs"
doctest = false

[[bin]]
name = "engine-cli"
path = "src/cli/main.rs"
test = false

[[bin]]
name = "helper"

[[example]]
name = "demo"

[[test]]
name = "integration"
harness = false

[[bench]]
name = "throughput"
)" };

}  // namespace

TEST_CASE("sanitize keeps exactly the package name and dependency for a minimal manifest") {
  auto const input{ parse(R"(
[package]
name = "foo"
description = "noise"
authors = ["a", "b"]

[dependencies]
bar = { version = "1.0" }
)") };

  auto const expected{ parse(R"(
[package]
name = "foo"

[dependencies]
bar = { version = "1.0" }
)") };

  auto const s{ husk::sanitize(input) };
  CHECK(s.document == expected.document);
  CHECK(target_paths(s) == std::vector<husk::rel_path>{ "src/lib.rs", "build.rs" });
}

TEST_CASE("sanitize retains every resolution-relevant section") {
  auto const s{ husk::sanitize(parse(kRichManifest)) };
  auto const &doc{ s.document };

  CHECK(doc["package"]["name"].value_or(std::string{}) == "engine");
  CHECK(doc["package"]["version"].value_or(std::string{}) == "0.3.1");
  CHECK(doc["package"]["edition"].value_or(std::string{}) == "2021");
  CHECK(doc["package"]["build"].value_or(std::string{}) == "tools/build.rs");
  CHECK(doc["dependencies"]["serde"]["features"][0].value_or(std::string{}) == "derive");
  CHECK(doc["dependencies"]["log"].value_or(std::string{}) == "0.4");
  CHECK(doc["dependencies"]["local"]["path"].value_or(std::string{}) == "../local");
  CHECK(doc["dev-dependencies"]["proptest"].value_or(std::string{}) == "1");
  CHECK(doc["build-dependencies"]["cc"].value_or(std::string{}) == "1.0");
  CHECK(doc["target"]["cfg(unix)"]["dependencies"]["libc"].value_or(std::string{}) ==
        "0.2");
  CHECK(doc["features"]["fast"][0].value_or(std::string{}) == "serde/std");
  CHECK(doc["patch"]["crates-io"]["log"]["git"].value_or(std::string{}) ==
        "https://example.com/log");
  CHECK(doc["profile"]["release"]["lto"].value_or(false));
  CHECK(doc["lib"]["name"].value_or(std::string{}) == "engine_core");
  CHECK(doc["bin"].as_array()->size() == 2);
  CHECK(doc["test"][0]["harness"].is_boolean());
}

TEST_CASE("sanitize drops non-structural fields") {
  auto const s{ husk::sanitize(parse(kRichManifest)) };
  auto const &doc{ s.document };

  CHECK_FALSE(doc["package"]["description"]);
  CHECK_FALSE(doc["package"]["authors"]);
  CHECK_FALSE(doc["package"]["license"]);
  CHECK_FALSE(doc["package"]["readme"]);
  CHECK_FALSE(doc["package"]["metadata"]);
  CHECK_FALSE(doc["badges"]);
  CHECK_FALSE(doc["lib"]["doctest"]);
  CHECK_FALSE(doc["bin"][0]["test"]);
  CHECK_FALSE(doc["target"]["cfg(windows)"]);
}

TEST_CASE("sanitize is idempotent") {
  std::vector<std::string_view> const inputs{
    kRichManifest,
    "[package]\nname = \"foo\"\n[dependencies]\nbar = \"1\"\n",
    "[workspace]\nmembers = [\"a\", \"b\"]\nexclude = [\"c\"]\n[workspace.package]\n"
    "version = \"1.0.0\"\ndescription = \"dropped\"\n[profile.dev]\nopt-level = 1\n",
    "",
  };

  for (auto const text : inputs) {
    auto const once{ husk::sanitize(parse(text)) };
    auto const twice{ husk::sanitize({ .path = once.path, .document = once.document }) };
    CHECK(twice == once);

    // Surviving a serialize/parse cycle is what the written output relies on.
    auto const reparsed{ husk::sanitize(
        parse(husk::manifest_serialize(once.document), once.path)) };
    CHECK(reparsed == once);
  }
}

TEST_CASE("sanitize output is stable under edits to dropped fields") {
  auto const base{ husk::sanitize(parse(R"(
[package]
name = "foo"
version = "1.2.3"
description = "first"

[dependencies]
bar = "1"

[[bin]]
name = "tool"
test = true
)")) };

  auto const edited{ husk::sanitize(parse(R"(
[package]
name = "foo"
version = "1.2.3"
description = "completely rewritten"
homepage = "https://example.com"
keywords = ["x", "y"]

[package.metadata.release]
sign = true

[dependencies]
bar = "1"

[[bin]]
name = "tool"
test = false
bench = false
)")) };

  CHECK(edited == base);
}

TEST_CASE("sanitize changes when a retained field changes") {
  auto const a{ husk::sanitize(parse("[package]\nname = \"foo\"\n[dependencies]\nbar = \"1\"\n")) };
  auto const b{ husk::sanitize(parse("[package]\nname = \"foo\"\n[dependencies]\nbar = \"2\"\n")) };
  CHECK_FALSE(a == b);
}

TEST_CASE("sanitize synthesizes default target paths into the role only") {
  auto const s{ husk::sanitize(parse(R"(
[package]
name = "my-crate"

[[bin]]
name = "runner"

[[example]]
name = "walkthrough"

[[test]]
name = "smoke"

[[bench]]
name = "speed"
)", "crates/my-crate/Cargo.toml")) };

  auto const &pkg{ package_of(s) };
  CHECK(pkg.name == "my-crate");
  CHECK(target_paths(s) == std::vector<husk::rel_path>{
                               "crates/my-crate/src/lib.rs",
                               "crates/my-crate/build.rs",
                               "crates/my-crate/src/bin/runner.rs",
                               "crates/my-crate/examples/walkthrough.rs",
                               "crates/my-crate/tests/smoke.rs",
                               "crates/my-crate/benches/speed.rs",
                           });
  CHECK(pkg.targets[0].kind == husk::target_kind::library);
  CHECK(pkg.targets[0].name == "my_crate");
  CHECK_FALSE(pkg.targets[0].explicit_path.has_value());
  CHECK(pkg.targets[1].kind == husk::target_kind::build_script);

  CHECK_FALSE(s.document["lib"]);
  CHECK_FALSE(s.document["bin"][0]["path"]);
}

TEST_CASE("sanitize honors explicit target paths") {
  auto const s{ husk::sanitize(parse(kRichManifest, "engine/Cargo.toml")) };

  CHECK(target_paths(s) == std::vector<husk::rel_path>{
                               "engine/src/core.rs",
                               "engine/build.rs",
                               "engine/tools/build.rs",
                               "engine/src/cli/main.rs",
                               "engine/src/bin/helper.rs",
                               "engine/examples/demo.rs",
                               "engine/tests/integration.rs",
                               "engine/benches/throughput.rs",
                           });

  auto const &lib{ package_of(s).targets[0] };
  CHECK(lib.name == "engine_core");
  CHECK(lib.explicit_path == std::optional<std::string>{ "src/core.rs" });
}

TEST_CASE("sanitize names a path-only target after its file stem") {
  auto const s{ husk::sanitize(parse("[package]\nname = \"p\"\n[[bin]]\npath = \"x/tool.rs\"\n")) };
  auto const &targets{ package_of(s).targets };
  REQUIRE(targets.size() == 3);
  CHECK(targets[2].name == "tool");
  CHECK(targets[2].resolved_path == "x/tool.rs");
}

TEST_CASE("sanitize emits one target per distinct path") {
  auto const s{ husk::sanitize(parse(R"(
[package]
name = "p"
build = "build.rs"

[lib]
path = "src/main.rs"

[[bin]]
name = "p"
path = "src/main.rs"
)")) };

  CHECK(target_paths(s) == std::vector<husk::rel_path>{ "src/main.rs", "build.rs" });
}

TEST_CASE("sanitize keeps build = false without an extra build script") {
  auto const s{ husk::sanitize(parse("[package]\nname = \"p\"\nbuild = false\n")) };
  CHECK(target_paths(s) == std::vector<husk::rel_path>{ "src/lib.rs", "build.rs" });
  CHECK(s.document["package"]["build"].value_or(true) == false);
}

TEST_CASE("sanitize treats a manifest without a package as a workspace root") {
  auto const s{ husk::sanitize(parse(R"(
[workspace]
members = ["crates/a", "crates/b"]
resolver = "2"

[workspace.dependencies]
serde = "1"

[workspace.metadata.ci]
dropped = true
)")) };

  auto const *ws{ std::get_if<husk::workspace_root>(&s.role) };
  REQUIRE(ws != nullptr);
  CHECK(ws->members == std::vector<std::string>{ "crates/a", "crates/b" });
  CHECK(s.document["workspace"]["dependencies"]["serde"].value_or(std::string{}) == "1");
  CHECK(s.document["workspace"]["resolver"].value_or(std::string{}) == "2");
  CHECK_FALSE(s.document["workspace"]["metadata"]);
}

TEST_CASE("sanitize keeps legacy underscore dependency tables") {
  auto const s{ husk::sanitize(
      parse("[package]\nname = \"p\"\n[dev_dependencies]\na = \"1\"\n[build_dependencies]\n"
            "b = \"2\"\n")) };
  CHECK(s.document["dev_dependencies"]["a"].value_or(std::string{}) == "1");
  CHECK(s.document["build_dependencies"]["b"].value_or(std::string{}) == "2");
}

TEST_CASE("sanitize rejects structurally invalid manifests") {
  auto const rejects{ [](std::string_view text) {
    CHECK_THROWS_AS(husk::sanitize(parse(text, "bad/Cargo.toml")), husk::manifest_format_error);
  } };

  SUBCASE("package without a name") { rejects("[package]\nversion = \"1\"\n"); }
  SUBCASE("package name not a string") { rejects("[package]\nname = 3\n"); }
  SUBCASE("package not a table") { rejects("package = \"foo\"\n"); }
  SUBCASE("lib given as array") { rejects("[package]\nname = \"p\"\n[[lib]]\nname = \"x\"\n"); }
  SUBCASE("bin given as table") { rejects("[package]\nname = \"p\"\n[bin]\nname = \"x\"\n"); }
  SUBCASE("target without name or path") {
    rejects("[package]\nname = \"p\"\n[[test]]\nharness = false\n");
  }
  SUBCASE("target path escapes the tree") {
    rejects("[package]\nname = \"p\"\n[[bin]]\nname = \"x\"\npath = \"../../../x.rs\"\n");
  }
  SUBCASE("absolute target path") {
    rejects("[package]\nname = \"p\"\n[lib]\npath = \"/usr/lib.rs\"\n");
  }
  SUBCASE("dependencies not a table") { rejects("dependencies = [\"a\"]\n"); }
  SUBCASE("build neither string nor boolean") { rejects("[package]\nname = \"p\"\nbuild = 1\n"); }
}

TEST_CASE("sanitize errors name the manifest") {
  try {
    husk::sanitize(parse("[package]\n", "crates/z/Cargo.toml"));
    FAIL("expected manifest_format_error");
  } catch (husk::manifest_format_error const &e) {
    CHECK(e.path() == std::filesystem::path{ "crates/z/Cargo.toml" });
    CHECK(std::string(e.what()).find("crates/z/Cargo.toml") != std::string::npos);
  }
}
