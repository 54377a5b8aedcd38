#include "changeview/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

int main() {
  using changeview::FileConfig;
  using changeview::Options;

  // parsing
  const auto cfg = changeview::parse_config("# defaults for this repo\n"
                                            "base:  develop \r\n"
                                            "sort: changes\n"
                                            "flat: yes\n"
                                            "color: false\n"
                                            "unknown: ignored\n");
  if (cfg.base != "develop" || cfg.sort != changeview::SortKey::Changes || cfg.flat != true ||
      cfg.color != false) {
    std::cerr << "config parse mismatch\n";
    return 1;
  }
  const auto bad = changeview::parse_config("sort: sideways\nflat: maybe\nbase:\n");
  if (bad.sort || bad.flat || bad.base) {
    std::cerr << "invalid values should be ignored\n";
    return 1;
  }

  // command line wins over the file
  {
    Options opts;
    changeview::apply_config(opts, cfg, {});
    if (opts.base_branch != "develop" || opts.sort != changeview::SortKey::Changes || !opts.flat) {
      std::cerr << "file defaults not applied\n";
      return 1;
    }
    Options explicit_opts;
    explicit_opts.sort = changeview::SortKey::Path;
    explicit_opts.base_branch = "trunk";
    changeview::apply_config(explicit_opts, cfg, {.sort = true, .base = true});
    if (explicit_opts.sort != changeview::SortKey::Path || explicit_opts.base_branch != "trunk") {
      std::cerr << "explicit flags overridden by file\n";
      return 1;
    }
  }

  // color resolution
  {
    ::unsetenv("NO_COLOR");
    Options opts;
    const FileConfig none{};
    if (!changeview::use_color(opts, none, true)) {
      std::cerr << "color expected on a terminal\n";
      return 1;
    }
    if (changeview::use_color(opts, none, false)) {
      std::cerr << "no color when stdout is not a terminal\n";
      return 1;
    }
    if (changeview::use_color(opts, cfg, true)) {
      std::cerr << "color: false in config should disable color\n";
      return 1;
    }
    opts.json = true;
    if (changeview::use_color(opts, none, true)) {
      std::cerr << "--json disables color\n";
      return 1;
    }
    opts.json = false;
    opts.no_color = true;
    if (changeview::use_color(opts, none, true)) {
      std::cerr << "--no-color disables color\n";
      return 1;
    }
    opts.no_color = false;
    ::setenv("NO_COLOR", "", 1);
    if (changeview::use_color(opts, none, true) || !changeview::no_color_env()) {
      std::cerr << "NO_COLOR (even empty) disables color\n";
      return 1;
    }
    ::unsetenv("NO_COLOR");
  }

  // loading from a repository root
  const fs::path root =
      fs::temp_directory_path() / ("changeview_config_" + std::to_string(std::random_device{}()));
  try {
    fs::create_directories(root);
    if (changeview::load_config(root).base) {
      std::cerr << "missing file should give empty config\n";
      fs::remove_all(root);
      return 1;
    }
    std::ofstream(root / ".changeview") << "base: release\n";
    if (changeview::load_config(root).base != "release") {
      std::cerr << "config file not loaded\n";
      fs::remove_all(root);
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  std::cout << "OK\n";
  return 0;
}
