#include "assemble.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <map>
#include <stdexcept>
#include <string>
#include <system_error>

namespace husk {

namespace {

namespace fs = std::filesystem;

struct writer {
  fs::path const &output_root;
  assembly_report report{};

  fs::path ensure_parent(rel_path const &rel) {
    fs::path const dst{ rel_path_to_fs(output_root, rel) };
    std::error_code ec;
    if (fs::create_directories(dst.parent_path(), ec)) { ++report.directories_created; }
    if (ec) {
      throw io_error("Failed to create directory (" + ec.message() + ")", dst.parent_path());
    }
    return dst;
  }

  void copy(fs::path const &src, rel_path const &rel, char const *source) {
    fs::path const dst{ ensure_parent(rel) };
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) { throw io_error("Failed to copy " + src.string() + " (" + ec.message() + ")", dst); }
    ++report.files_written;
    HUSK_TRACE_OUTPUT_WRITTEN(rel, source);
  }

  void write(rel_path const &rel, std::string_view content, char const *source) {
    fs::path const dst{ ensure_parent(rel) };
    try {
      util_write_file(dst, content);
    } catch (std::runtime_error const &e) {
      throw io_error(e.what(), dst);
    }
    ++report.files_written;
    HUSK_TRACE_OUTPUT_WRITTEN(rel, source);
  }
};

}  // namespace

void assemble_check_collisions(assembly_plan const &plan) {
  std::map<rel_path, rel_path> owners;  // output path -> declaring manifest

  auto const claim{ [&](rel_path const &path, rel_path const &owner) {
    auto const [it, inserted]{ owners.try_emplace(path, owner) };
    if (!inserted && it->second != owner) {
      throw path_collision_error(
          "Output claimed by both " + it->second + " and " + owner, path);
    }
  } };

  for (auto const &m : plan.manifests) { claim(m.path, m.path); }
  for (auto const &s : plan.stubs) { claim(s.path, s.manifest); }

  // A manifest and a stub of that same manifest cannot share a path either.
  for (auto const &s : plan.stubs) {
    if (s.path == s.manifest) {
      throw path_collision_error("Target entry point overlaps its own manifest", s.path);
    }
  }
}

assembly_report assemble(assembly_plan const &plan) {
  assemble_check_collisions(plan);

  if (std::error_code ec{ platform::remove_all_with_retry(plan.output_root) }) {
    throw io_error("Failed to clear output directory (" + ec.message() + ")",
                   plan.output_root);
  }

  std::error_code ec;
  fs::create_directories(plan.output_root, ec);
  if (ec) {
    throw io_error("Failed to create output directory (" + ec.message() + ")",
                   plan.output_root);
  }

  writer w{ .output_root = plan.output_root };

  for (auto const &dir : plan.filtered.directories) {
    fs::path const dst{ rel_path_to_fs(plan.output_root, dir) };
    if (fs::create_directories(dst, ec)) { ++w.report.directories_created; }
    if (ec) { throw io_error("Failed to create directory (" + ec.message() + ")", dst); }
  }

  for (auto const &file : plan.filtered.files) {
    w.copy(rel_path_to_fs(plan.source_root, file), file, "filter");
  }

  if (plan.lock) { w.copy(plan.lock->source, plan.lock->destination, "lock"); }

  for (auto const &m : plan.manifests) {
    w.write(m.path, manifest_serialize(m.document), "manifest");
  }

  for (auto const &s : plan.stubs) { w.write(s.path, stub_source(), "stub"); }

  tui::debug("assemble: %zu files, %zu directories under %s",
             w.report.files_written,
             w.report.directories_created,
             plan.output_root.string().c_str());
  return w.report;
}

}  // namespace husk
