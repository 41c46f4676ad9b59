#include "manifest.h"

#include "errors.h"
#include "platform.h"
#include "util.h"

#include <sstream>
#include <stdexcept>

namespace husk {

std::string_view target_kind_name(target_kind kind) {
  switch (kind) {
    case target_kind::library: return "lib";
    case target_kind::binary: return "bin";
    case target_kind::example: return "example";
    case target_kind::test: return "test";
    case target_kind::benchmark: return "bench";
    case target_kind::build_script: return "build-script";
  }
  HUSK_UNREACHABLE();
}

rel_path manifest_dir(rel_path const &manifest_path) {
  return rel_path_parent(manifest_path);
}

manifest_file manifest_load(std::filesystem::path const &root, rel_path const &rel) {
  std::vector<unsigned char> bytes;
  try {
    bytes = util_load_file(rel_path_to_fs(root, rel));
  } catch (std::runtime_error const &e) {
    throw manifest_format_error(std::string{ "Cannot read manifest (" } + e.what() + ")",
                                rel);
  }

  return manifest_parse(
      std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() },
      rel);
}

manifest_file manifest_parse(std::string_view text, rel_path const &rel) {
  try {
    return { .path = rel, .document = toml::parse(text, std::string_view{ rel }) };
  } catch (toml::parse_error const &e) {
    std::ostringstream oss;
    oss << "Malformed manifest (line " << e.source().begin.line << ", column "
        << e.source().begin.column << ": " << e.description() << ")";
    throw manifest_format_error(oss.str(), rel);
  }
}

std::string manifest_serialize(toml::table const &document) {
  std::ostringstream oss;
  oss << toml::toml_formatter{ document } << '\n';
  return oss.str();
}

}  // namespace husk
