#pragma once
// Helpers for tests that build throwaway repositories with the real git binary.
#include "changeview/process.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fixture {

namespace fs = std::filesystem;

inline constexpr int kSkip = 77;

inline bool git_available() {
  try {
    return changeview::process::run({"git", "--version"}, fs::temp_directory_path()).ok();
  } catch (const std::exception &) {
    return false;
  }
}

// Pin identity, dates and config so results do not depend on the host.
inline void isolate_git_env() {
  ::setenv("GIT_CONFIG_NOSYSTEM", "1", 1);
  ::setenv("GIT_CONFIG_GLOBAL", "/dev/null", 1);
  ::setenv("GIT_AUTHOR_NAME", "Test User", 1);
  ::setenv("GIT_AUTHOR_EMAIL", "test@example.com", 1);
  ::setenv("GIT_COMMITTER_NAME", "Test User", 1);
  ::setenv("GIT_COMMITTER_EMAIL", "test@example.com", 1);
  ::setenv("GIT_AUTHOR_DATE", "1700000000 +0300", 1);
  ::setenv("GIT_COMMITTER_DATE", "1700000000 +0300", 1);
  ::unsetenv("NO_COLOR");
}

inline fs::path make_temp_dir(std::string_view tag) {
  const fs::path p = fs::temp_directory_path() /
                     ("changeview_" + std::string(tag) + "_" +
                      std::to_string(std::random_device{}()));
  fs::create_directories(p);
  return p;
}

inline std::string git(const fs::path &root, std::vector<std::string> args) {
  args.insert(args.begin(), "git");
  const auto res = changeview::process::run(args, root);
  if (!res.ok())
    throw std::runtime_error("git " + args[1] + " failed: " + res.err);
  return res.out;
}

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

// Empty repository whose unborn branch is `branch`.
inline void init_repo(const fs::path &root, const std::string &branch = "main") {
  git(root, {"init", "-q"});
  git(root, {"symbolic-ref", "HEAD", "refs/heads/" + branch});
}

inline std::string commit_all(const fs::path &root, const std::string &message) {
  git(root, {"add", "-A"});
  git(root, {"-c", "commit.gpgsign=false", "commit", "-q", "-m", message});
  auto id = git(root, {"rev-parse", "HEAD"});
  while (!id.empty() && (id.back() == '\n' || id.back() == '\r'))
    id.pop_back();
  return id;
}

} // namespace fixture
