#include "discovery.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace husk {

namespace {

namespace fs = std::filesystem;

struct walker {
  fs::path const &root;
  discovery_options const &opts;
  discovery_result &out;

  bool readable(rel_path const &rel, fs::path const &path) {
    if (util_open_file(path, "rb")) { return true; }

    std::string const reason{ std::error_code{ errno, std::generic_category() }.message() };
    tui::warn("Skipping unreadable file %s: %s", rel.c_str(), reason.c_str());
    HUSK_TRACE_FILE_SKIPPED(rel, reason);
    out.skipped.push_back({ .path = rel, .reason = reason });
    return false;
  }

  bool is_config(std::string_view dir_name, std::string const &name) const {
    return dir_name == opts.config_dir && std::ranges::find(opts.config_names, name) !=
                                              opts.config_names.end();
  }

  void walk(rel_path const &dir_rel) {
    fs::path const dir{ rel_path_to_fs(root, dir_rel) };
    std::string_view const dir_name{ rel_path_filename(dir_rel) };

    std::vector<rel_path> subdirs;
    std::error_code ec;
    for (fs::directory_iterator it{ dir, ec }, end; !ec && it != end; it.increment(ec)) {
      auto const &entry{ *it };
      auto const name{ entry.path().filename().string() };
      rel_path const rel{ dir_rel.empty() ? name : dir_rel + "/" + name };

      std::error_code type_ec;
      if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
        if (std::ranges::find(opts.excluded, rel) != opts.excluded.end()) {
          tui::debug("Excluding directory %s", rel.c_str());
          HUSK_TRACE_DIRECTORY_EXCLUDED(rel);
          continue;
        }
        subdirs.push_back(rel);
        continue;
      }

      if (!entry.is_regular_file(type_ec)) { continue; }

      if (name == opts.manifest_name) {
        if (readable(rel, entry.path())) {
          HUSK_TRACE_FILE_DISCOVERED(rel, "manifest");
          out.manifests.push_back(rel);
        }
      } else if (is_config(dir_name, name)) {
        if (readable(rel, entry.path())) {
          HUSK_TRACE_FILE_DISCOVERED(rel, "config");
          out.configs.push_back(rel);
        }
      }
    }

    if (ec) { throw traversal_error("Cannot read directory (" + ec.message() + ")", dir); }

    for (auto const &sub : subdirs) { walk(sub); }
  }
};

}  // namespace

discovery_result discover(std::filesystem::path const &root,
                          discovery_options const &opts) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw traversal_error("Source root is not a readable directory", root);
  }

  discovery_result result;
  walker{ .root = root, .opts = opts, .out = result }.walk(rel_path{});

  std::ranges::sort(result.manifests);
  std::ranges::sort(result.configs);

  tui::debug("Discovered %zu manifest(s), %zu config file(s) under %s",
             result.manifests.size(),
             result.configs.size(),
             root.string().c_str());
  return result;
}

}  // namespace husk
