#include "stub.h"

#include "util.h"

#include <variant>

namespace husk {

std::string_view stub_source() {
  static constexpr std::string_view kStub{ "#![allow(dead_code)]\npub fn main() {}\n" };
  return kStub;
}

std::vector<stub_file> synthesize_stubs(sanitized_manifest const &m) {
  return std::visit(
      match{
          [](workspace_root const &) { return std::vector<stub_file>{}; },
          [&m](package_root const &pkg) {
            std::vector<stub_file> stubs;
            stubs.reserve(pkg.targets.size());
            for (auto const &t : pkg.targets) {
              stubs.push_back(
                  { .path = t.resolved_path, .manifest = m.path, .kind = t.kind });
            }
            return stubs;
          },
      },
      m.role);
}

}  // namespace husk
