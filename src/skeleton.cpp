#include "skeleton.h"

#include "assemble.h"
#include "errors.h"
#include "manifest.h"
#include "sanitize.h"
#include "source_filter.h"
#include "stub.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include "tbb/global_control.h"
#include "tbb/task_group.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace husk {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kDefaultLockName{ "Cargo.lock" };

struct manifest_outcome {
  std::optional<sanitized_manifest> manifest;
  std::vector<stub_file> stubs;
  bool rejected{ false };
};

manifest_outcome process_manifest(fs::path const &root,
                                  rel_path const &rel,
                                  malformed_policy policy) {
  try {
    auto sanitized{ sanitize(manifest_load(root, rel)) };
    auto stubs{ synthesize_stubs(sanitized) };

    std::visit(match{ [&](workspace_root const &) {
                       HUSK_TRACE_MANIFEST_SANITIZED(rel, "workspace", 0);
                     },
                      [&](package_root const &pkg) {
                        HUSK_TRACE_MANIFEST_SANITIZED(
                            rel,
                            "package",
                            static_cast<std::int64_t>(pkg.targets.size()));
                      } },
               sanitized.role);

    return { .manifest = std::move(sanitized), .stubs = std::move(stubs), .rejected = false };
  } catch (manifest_format_error const &e) {
    HUSK_TRACE_MANIFEST_REJECTED(rel, e.what());
    if (policy == malformed_policy::abort) { throw; }
    tui::warn("Skipping malformed manifest: %s", e.what());
    return { .manifest = std::nullopt, .stubs = {}, .rejected = true };
  }
}

fs::path absolute_path(fs::path const &p) {
  std::error_code ec;
  auto result{ fs::weakly_canonical(fs::absolute(p, ec), ec) };
  if (ec) { throw io_error("Cannot resolve path (" + ec.message() + ")", p); }
  return result;
}

// Locate the lock file. A lock inside the tree keeps its relative path; one supplied from
// elsewhere lands at the output root under the conventional name.
std::optional<lock_file_copy> resolve_lock(fs::path const &source,
                                           std::optional<fs::path> const &explicit_lock) {
  fs::path const lock{ explicit_lock ? absolute_path(*explicit_lock)
                                     : source / kDefaultLockName };

  std::error_code ec;
  if (!fs::is_regular_file(lock, ec)) {
    tui::debug("No lock file at %s", lock.string().c_str());
    HUSK_TRACE_LOCK_FILE_MISSING(lock.string());
    return std::nullopt;
  }

  auto rel{ rel_path_from(source, lock) };
  if (!rel || rel->empty()) { rel = rel_path{ kDefaultLockName }; }
  return lock_file_copy{ .source = lock, .destination = std::move(*rel) };
}

}  // namespace

std::string_view malformed_policy_name(malformed_policy p) {
  switch (p) {
    case malformed_policy::abort: return "abort";
    case malformed_policy::skip: return "skip";
  }
  return "unknown";
}

std::optional<malformed_policy> malformed_policy_parse(std::string_view s) {
  if (s == "abort") { return malformed_policy::abort; }
  if (s == "skip") { return malformed_policy::skip; }
  return std::nullopt;
}

skeleton_report build_skeleton(skeleton_options const &opts) {
  fs::path const source{ absolute_path(opts.source) };
  fs::path const output{ absolute_path(opts.output) };

  if (rel_path_from(output, source)) {
    throw std::invalid_argument("Output directory " + output.string() +
                                " would replace source tree " + source.string());
  }

  std::optional<tbb::global_control> parallelism;
  if (opts.jobs) {
    parallelism.emplace(tbb::global_control::max_allowed_parallelism,
                        std::max<std::size_t>(*opts.jobs, 1));
  }

  discovery_options disc{ opts.discovery };
  if (auto const nested{ rel_path_from(source, output) }) { disc.excluded.push_back(*nested); }

  discovery_result discovered;
  {
    phase_trace_scope const scope{ phase::discover };
    discovered = discover(source, disc);
  }

  auto lock{ resolve_lock(source, opts.lock_file) };
  std::optional<rel_path> lock_in_tree;
  if (lock && rel_path_from(source, lock->source)) { lock_in_tree = lock->destination; }

  std::vector<manifest_outcome> outcomes(discovered.manifests.size());
  filter_result filtered;

  tbb::task_group tg;
  tg.run([&] {
    phase_trace_scope const scope{ phase::sanitize };
    tbb::task_group per_manifest;
    for (std::size_t i{}; i < discovered.manifests.size(); ++i) {
      per_manifest.run([&, i] {
        outcomes[i] = process_manifest(source, discovered.manifests[i], opts.on_malformed);
      });
    }
    per_manifest.wait();
  });

  tg.run([&] {
    interesting_file_set interesting;
    {
      phase_trace_scope const scope{ phase::filter_collect };
      interesting = collect_interesting_files(discovered, lock_in_tree);
    }
    phase_trace_scope const scope{ phase::filter_select };
    filtered = filter_tree(source, interesting);
  });

  tg.wait();

  skeleton_report report{ .configs = discovered.configs.size(),
                          .filtered_files = filtered.files.size(),
                          .filtered_directories = filtered.directories.size(),
                          .unreadable_files = discovered.skipped.size(),
                          .lock_copied = lock.has_value() };

  assembly_plan plan{ .source_root = source,
                      .output_root = output,
                      .filtered = std::move(filtered),
                      .lock = std::move(lock),
                      .manifests = {},
                      .stubs = {} };

  for (std::size_t i{}; i < outcomes.size(); ++i) {
    auto &outcome{ outcomes[i] };
    if (outcome.rejected) {
      report.rejected_manifests.push_back(discovered.manifests[i]);
      continue;
    }
    if (std::holds_alternative<workspace_root>(outcome.manifest->role)) {
      ++report.workspace_roots;
    }
    plan.stubs.insert(plan.stubs.end(),
                      std::make_move_iterator(outcome.stubs.begin()),
                      std::make_move_iterator(outcome.stubs.end()));
    plan.manifests.push_back(std::move(*outcome.manifest));
  }

  report.manifests = plan.manifests.size();
  report.stubs = plan.stubs.size();

  {
    phase_trace_scope const scope{ phase::assemble };
    assemble(plan);
  }

  return report;
}

}  // namespace husk
