#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace changeview::process {

struct Result {
  int exit_code = -1;  // 127 if the program could not be executed
  std::string out;
  std::string err;

  [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// Run argv[0] (looked up in PATH) with the given arguments in `cwd`.
// stdout and stderr are captured; stdin is /dev/null.
// Throws std::runtime_error if the child cannot be spawned.
auto run(const std::vector<std::string> &argv, const std::filesystem::path &cwd) -> Result;

// Echo commands to stderr when CHANGEVIEW_TRACE is set.
bool trace_enabled();

} // namespace changeview::process
