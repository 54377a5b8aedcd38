#pragma once
#include "changeview/change.hpp"
#include "changeview/consts.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace changeview {

// Settings read from <repo>/.changeview. Unset fields keep built-in defaults.
struct FileConfig {
  std::optional<std::string> base;
  std::optional<SortKey> sort;
  std::optional<bool> flat;
  std::optional<bool> color;
};

struct Options {
  Mode mode = Mode::Default;
  SortKey sort = SortKey::Name;
  bool flat = false;
  bool json = false;
  bool no_color = false;
  std::string base_branch{consts::kDefaultBase};
};

// Parse "key: value" lines; '#' starts a comment line. Missing file -> empty config.
auto load_config(const std::filesystem::path &repo_root) -> FileConfig;
auto parse_config(const std::string &text) -> FileConfig;

// Defaults that the command line has not overridden are taken from `file`.
struct ExplicitFlags {
  bool sort = false;
  bool base = false;
};
void apply_config(Options &opts, const FileConfig &file, const ExplicitFlags &given);

// Color is on only for text output to a terminal, without --no-color, NO_COLOR
// or "color: false".
auto use_color(const Options &opts, const FileConfig &file, bool stdout_is_tty) -> bool;

// True if NO_COLOR is present in the environment (any value).
auto no_color_env() -> bool;

} // namespace changeview
