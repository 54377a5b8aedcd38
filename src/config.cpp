#include "changeview/config.hpp"

#include "changeview/fs.hpp"
#include "changeview/util.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace {

std::optional<bool> parse_bool(std::string_view sv) {
  if (sv == "true" || sv == "yes" || sv == "on" || sv == "1")
    return true;
  if (sv == "false" || sv == "no" || sv == "off" || sv == "0")
    return false;
  return std::nullopt;
}

} // namespace

namespace changeview {

std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kConfigFile;
}

auto parse_config(const std::string &text) -> FileConfig {
  FileConfig out{};
  std::istringstream iss(text);

  constexpr std::string_view k_base = "base:";
  constexpr std::string_view k_sort = "sort:";
  constexpr std::string_view k_flat = "flat:";
  constexpr std::string_view k_color = "color:";

  std::string line;
  while (std::getline(iss, line)) {
    const std::string trimmed = strutil::trim(line);
    std::string_view sv{trimmed};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.rfind(k_base, 0) == 0) {
      if (auto v = strutil::trim(sv.substr(k_base.size())); !v.empty())
        out.base = std::move(v);
    } else if (sv.rfind(k_sort, 0) == 0) {
      out.sort = parse_sort_key(strutil::trim(sv.substr(k_sort.size())));
    } else if (sv.rfind(k_flat, 0) == 0) {
      out.flat = parse_bool(strutil::trim(sv.substr(k_flat.size())));
    } else if (sv.rfind(k_color, 0) == 0) {
      out.color = parse_bool(strutil::trim(sv.substr(k_color.size())));
    }
  }
  return out;
}

auto load_config(const std::filesystem::path &repo_root) -> FileConfig {
  const auto path = cfg_path(repo_root);
  if (!fs::exists(path))
    return FileConfig{};
  return parse_config(fs::read_file(path));
}

void apply_config(Options &opts, const FileConfig &file, const ExplicitFlags &given) {
  if (file.base && !given.base)
    opts.base_branch = *file.base;
  if (file.sort && !given.sort)
    opts.sort = *file.sort;
  if (file.flat.value_or(false))
    opts.flat = true;
}

auto no_color_env() -> bool { return std::getenv("NO_COLOR") != nullptr; }

auto use_color(const Options &opts, const FileConfig &file, bool stdout_is_tty) -> bool {
  if (opts.no_color || opts.json || !stdout_is_tty)
    return false;
  if (file.color && !*file.color)
    return false;
  return !no_color_env();
}

} // namespace changeview
