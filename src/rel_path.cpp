#include "rel_path.h"

namespace husk {

namespace {

std::filesystem::path strip_trailing_separator(std::filesystem::path p) {
  p = p.lexically_normal();
  if (!p.has_filename() && p.has_relative_path()) { p = p.parent_path(); }
  return p;
}

}  // namespace

std::optional<rel_path> rel_path_from(std::filesystem::path const &root,
                                      std::filesystem::path const &p) {
  auto const base{ strip_trailing_separator(root) };
  auto const target{ strip_trailing_separator(p) };
  auto const rel{ target.lexically_relative(base) };

  if (rel.empty()) { return std::nullopt; }  // different roots, or not comparable
  if (rel == ".") { return rel_path{}; }

  auto const first{ *rel.begin() };
  if (first == "..") { return std::nullopt; }

  return rel.generic_string();
}

std::optional<rel_path> rel_path_join(rel_path const &dir, std::string_view child) {
  if (child.empty() || child.front() == '/' || child.front() == '\\') {
    return std::nullopt;
  }
  if (std::filesystem::path{ child }.has_root_name()) { return std::nullopt; }

  std::vector<std::string_view> parts;
  auto const push_components{ [&parts](std::string_view s) -> bool {
    while (!s.empty()) {
      auto const pos{ s.find_first_of("/\\") };
      auto const token{ s.substr(0, pos) };
      if (token == "..") {
        if (parts.empty()) { return false; }
        parts.pop_back();
      } else if (!token.empty() && token != ".") {
        parts.push_back(token);
      }
      s = (pos == std::string_view::npos) ? std::string_view{} : s.substr(pos + 1);
    }
    return true;
  } };

  if (!push_components(dir) || !push_components(child)) { return std::nullopt; }

  rel_path result;
  for (auto const &part : parts) {
    if (!result.empty()) { result.push_back('/'); }
    result.append(part);
  }
  return result;
}

rel_path rel_path_parent(rel_path const &p) {
  auto const pos{ p.rfind('/') };
  return pos == rel_path::npos ? rel_path{} : p.substr(0, pos);
}

std::string_view rel_path_filename(rel_path const &p) {
  auto const pos{ p.rfind('/') };
  std::string_view const sv{ p };
  return pos == rel_path::npos ? sv : sv.substr(pos + 1);
}

std::vector<rel_path> rel_path_ancestors(rel_path const &p) {
  std::vector<rel_path> result;
  for (auto pos{ p.find('/') }; pos != rel_path::npos; pos = p.find('/', pos + 1)) {
    result.push_back(p.substr(0, pos));
  }
  return result;
}

std::filesystem::path rel_path_to_fs(std::filesystem::path const &root,
                                     rel_path const &p) {
  if (p.empty()) { return root; }
  return root / std::filesystem::path{ p }.make_preferred();
}

}  // namespace husk
