#include "cmd_skeleton.h"

#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace husk {

void cmd_skeleton::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("skeleton",
                                "Build the dependency-only skeleton of a source tree") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source, "Source tree root")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("output", cfg_ptr->output, "Output directory (replaced entirely)")
      ->required();
  sub->add_option("--lock-file",
                  cfg_ptr->lock_file,
                  "Lock file to copy (defaults to <source>/Cargo.lock)");
  sub->add_option("--on-malformed",
                  cfg_ptr->on_malformed,
                  "Malformed manifest handling: abort the run or skip the manifest")
      ->check(CLI::IsMember({ "abort", "skip" }));
  sub->add_option("--manifest-name", cfg_ptr->manifest_name, "Manifest file name");
  sub->add_option("--exclude",
                  cfg_ptr->excluded,
                  "Directory (relative to source) to leave out of discovery");
  sub->add_option("--jobs", cfg_ptr->jobs, "Maximum worker threads")
      ->check(CLI::PositiveNumber);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

skeleton_options cmd_skeleton::make_options(cfg const &c) {
  auto const policy{ malformed_policy_parse(c.on_malformed) };
  if (!policy) {
    throw std::invalid_argument("skeleton: unknown --on-malformed value: " + c.on_malformed);
  }
  if (c.manifest_name.empty() || c.manifest_name.find_first_of("/\\") != std::string::npos) {
    throw std::invalid_argument("skeleton: --manifest-name must be a bare file name");
  }

  skeleton_options opts{ .source = c.source,
                         .output = c.output,
                         .lock_file = c.lock_file,
                         .discovery = {},
                         .on_malformed = *policy,
                         .jobs = c.jobs };
  opts.discovery.manifest_name = c.manifest_name;

  for (auto const &dir : c.excluded) {
    auto rel{ rel_path_join(rel_path{}, dir) };
    if (!rel || rel->empty()) {
      throw std::invalid_argument("skeleton: --exclude must name a directory inside the "
                                  "source tree: " +
                                  dir);
    }
    opts.discovery.excluded.push_back(std::move(*rel));
  }

  return opts;
}

cmd_skeleton::cmd_skeleton(cmd_skeleton::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_skeleton::execute() {
  auto const report{ build_skeleton(make_options(cfg_)) };

  for (auto const &rejected : report.rejected_manifests) {
    tui::warn("Excluded malformed manifest %s", rejected.c_str());
  }
  if (report.unreadable_files) {
    tui::warn("%zu unreadable file(s) were skipped", report.unreadable_files);
  }

  tui::info("Skeleton written to %s", cfg_.output.string().c_str());
  tui::info("  manifests: %zu (%zu workspace roots)", report.manifests, report.workspace_roots);
  tui::info("  stubs: %zu", report.stubs);
  tui::info("  config files: %zu", report.configs);
  tui::info("  lock file: %s", report.lock_copied ? "copied" : "none");
}

}  // namespace husk
