#include "sanitize.h"

#include "errors.h"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace husk {

namespace {

using namespace std::string_view_literals;

constexpr std::array kPackageKeys{ "name"sv,         "version"sv,      "edition"sv,
                                   "rust-version"sv, "resolver"sv,     "links"sv,
                                   "build"sv,        "workspace"sv,    "autobins"sv,
                                   "autoexamples"sv, "autotests"sv,    "autobenches"sv };

// Underscore spellings are legacy aliases the build tool still honors.
constexpr std::array kDependencyTables{ "dependencies"sv,
                                        "dev-dependencies"sv,
                                        "dev_dependencies"sv,
                                        "build-dependencies"sv,
                                        "build_dependencies"sv };

constexpr std::array kVerbatimTables{ "features"sv, "patch"sv, "replace"sv, "profile"sv };

constexpr std::array kTargetKeys{ "name"sv,     "path"sv,
                                  "crate-type"sv, "proc-macro"sv,
                                  "harness"sv,  "required-features"sv,
                                  "edition"sv };

constexpr std::array kWorkspaceKeys{ "members"sv,
                                     "exclude"sv,
                                     "default-members"sv,
                                     "resolver"sv,
                                     "dependencies"sv };

struct target_array_spec {
  std::string_view key;
  target_kind kind;
  std::string_view default_dir;
};

constexpr std::array kTargetArrays{
  target_array_spec{ "bin", target_kind::binary, "src/bin" },
  target_array_spec{ "example", target_kind::example, "examples" },
  target_array_spec{ "test", target_kind::test, "tests" },
  target_array_spec{ "bench", target_kind::benchmark, "benches" },
};

constexpr std::string_view kDefaultLibPath{ "src/lib.rs" };
constexpr std::string_view kDefaultBuildScriptPath{ "build.rs" };
constexpr std::string_view kBuildScriptName{ "build-script-build" };

void copy_node(toml::table &dst, std::string_view key, toml::node const &node) {
  node.visit([&](auto const &concrete) { dst.insert_or_assign(key, concrete); });
}

template <std::size_t N>
toml::table retain_keys(toml::table const &src,
                        std::array<std::string_view, N> const &keys) {
  toml::table out;
  for (auto const key : keys) {
    if (auto const *node{ src.get(key) }) { copy_node(out, key, *node); }
  }
  return out;
}

toml::table const &require_table(toml::node const &node,
                                 std::string_view what,
                                 rel_path const &manifest) {
  auto const *tbl{ node.as_table() };
  if (!tbl) {
    throw manifest_format_error(std::string{ what } + " must be a table", manifest);
  }
  return *tbl;
}

std::optional<std::string> string_field(toml::table const &tbl,
                                        std::string_view key,
                                        std::string_view what,
                                        rel_path const &manifest) {
  auto const *node{ tbl.get(key) };
  if (!node) { return std::nullopt; }
  if (auto str{ node->value<std::string>() }) { return str; }
  throw manifest_format_error(
      std::string{ what } + " key '" + std::string{ key } + "' must be a string",
      manifest);
}

struct target_collector {
  rel_path const &manifest;
  rel_path dir;
  std::vector<target> targets;

  void add(target_kind kind,
           std::string name,
           std::optional<std::string> explicit_path,
           std::string_view fallback) {
    std::string_view const written{ explicit_path ? std::string_view{ *explicit_path }
                                                  : fallback };
    auto resolved{ rel_path_join(dir, written) };
    if (!resolved || resolved->empty()) {
      throw manifest_format_error("Path '" + std::string{ written } + "' of " +
                                      std::string{ target_kind_name(kind) } + " target '" +
                                      name + "' escapes the source tree",
                                  manifest);
    }

    // One stub per path, even if several targets share an entry point.
    if (std::ranges::any_of(targets,
                            [&](target const &t) { return t.resolved_path == *resolved; })) {
      return;
    }

    targets.push_back({ .kind = kind,
                        .name = std::move(name),
                        .explicit_path = std::move(explicit_path),
                        .resolved_path = std::move(*resolved) });
  }
};

std::vector<target> resolve_targets(toml::table const &doc,
                                    toml::table const &pkg,
                                    std::string const &package_name,
                                    rel_path const &manifest) {
  target_collector c{ .manifest = manifest, .dir = manifest_dir(manifest), .targets = {} };

  std::string lib_name{ package_name };
  std::ranges::replace(lib_name, '-', '_');
  std::optional<std::string> lib_path;
  if (auto const *lib{ doc["lib"].as_table() }) {
    if (auto name{ string_field(*lib, "name", "[lib]", manifest) }) {
      lib_name = std::move(*name);
    }
    lib_path = string_field(*lib, "path", "[lib]", manifest);
  }
  c.add(target_kind::library, std::move(lib_name), std::move(lib_path), kDefaultLibPath);

  // The default build script is always stubbed so build-dependencies get compiled.
  c.add(target_kind::build_script,
        std::string{ kBuildScriptName },
        std::nullopt,
        kDefaultBuildScriptPath);

  if (auto const *build{ pkg.get("build") }) {
    if (auto custom{ build->value<std::string>() }) {
      c.add(target_kind::build_script,
            std::string{ kBuildScriptName },
            std::move(custom),
            kDefaultBuildScriptPath);
    } else if (!build->is_boolean()) {
      throw manifest_format_error("package.build must be a string or a boolean", manifest);
    }
  }

  for (auto const &spec : kTargetArrays) {
    auto const *arr{ doc[spec.key].as_array() };
    if (!arr) { continue; }

    std::string const what{ "[[" + std::string{ spec.key } + "]]" };
    for (auto const &el : *arr) {
      auto const &tbl{ require_table(el, what, manifest) };
      auto name{ string_field(tbl, "name", what, manifest) };
      auto path{ string_field(tbl, "path", what, manifest) };
      if (!name && !path) {
        throw manifest_format_error(what + " entry requires a name or a path", manifest);
      }
      if (!name) { name = std::filesystem::path{ *path }.stem().string(); }

      std::string const fallback{ std::string{ spec.default_dir } + "/" + *name + ".rs" };
      c.add(spec.kind, std::move(*name), std::move(path), fallback);
    }
  }

  return std::move(c.targets);
}

manifest_role resolve_role(toml::table const &doc, rel_path const &manifest) {
  auto const *pkg{ doc["package"].as_table() };
  if (!pkg) {
    workspace_root ws;
    if (auto const *members{ doc["workspace"]["members"].as_array() }) {
      for (auto const &member : *members) {
        auto str{ member.value<std::string>() };
        if (!str) {
          throw manifest_format_error("workspace.members entries must be strings",
                                      manifest);
        }
        ws.members.push_back(std::move(*str));
      }
    }
    return ws;
  }

  auto name{ (*pkg)["name"].value<std::string>() };
  if (!name) { throw manifest_format_error("[package] requires a string name", manifest); }

  auto targets{ resolve_targets(doc, *pkg, *name, manifest) };
  return package_root{ .name = std::move(*name), .targets = std::move(targets) };
}

}  // namespace

sanitized_manifest sanitize(manifest_file const &m) {
  auto const &src{ m.document };
  toml::table doc;

  if (auto const *node{ src.get("package") }) {
    doc.insert_or_assign("package",
                         retain_keys(require_table(*node, "[package]", m.path), kPackageKeys));
  }

  for (auto const key : kDependencyTables) {
    if (auto const *node{ src.get(key) }) {
      copy_node(doc, key, require_table(*node, key, m.path));
    }
  }

  if (auto const *node{ src.get("target") }) {
    toml::table platforms;
    for (auto &&[cfg, cfg_node] : require_table(*node, "[target]", m.path)) {
      std::string const what{ "[target." + std::string{ cfg.str() } + "]" };
      auto kept{ retain_keys(require_table(cfg_node, what, m.path), kDependencyTables) };
      if (!kept.empty()) { platforms.insert_or_assign(cfg.str(), std::move(kept)); }
    }
    if (!platforms.empty()) { doc.insert_or_assign("target", std::move(platforms)); }
  }

  for (auto const key : kVerbatimTables) {
    if (auto const *node{ src.get(key) }) {
      copy_node(doc, key, require_table(*node, key, m.path));
    }
  }

  if (auto const *node{ src.get("lib") }) {
    doc.insert_or_assign("lib", retain_keys(require_table(*node, "[lib]", m.path), kTargetKeys));
  }

  for (auto const &spec : kTargetArrays) {
    auto const *node{ src.get(spec.key) };
    if (!node) { continue; }

    std::string const what{ "[[" + std::string{ spec.key } + "]]" };
    auto const *arr{ node->as_array() };
    if (!arr) {
      throw manifest_format_error(what + " must be an array of tables", m.path);
    }

    toml::array kept;
    for (auto const &el : *arr) {
      kept.push_back(retain_keys(require_table(el, what, m.path), kTargetKeys));
    }
    doc.insert_or_assign(spec.key, std::move(kept));
  }

  if (auto const *node{ src.get("workspace") }) {
    auto const &ws{ require_table(*node, "[workspace]", m.path) };
    auto kept{ retain_keys(ws, kWorkspaceKeys) };
    if (auto const *pkg{ ws.get("package") }) {
      kept.insert_or_assign(
          "package",
          retain_keys(require_table(*pkg, "[workspace.package]", m.path), kPackageKeys));
    }
    doc.insert_or_assign("workspace", std::move(kept));
  }

  auto role{ resolve_role(doc, m.path) };
  return { .path = m.path, .role = std::move(role), .document = std::move(doc) };
}

}  // namespace husk
