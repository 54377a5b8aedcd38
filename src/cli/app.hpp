#pragma once
#include "changeview/config.hpp"

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace changeview::cli {

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Invocation {
  Options opts;
  ExplicitFlags given;
  bool help = false;
  bool version = false;
};

// Parse arguments (without the program name). Throws UsageError.
auto parse_args(const std::vector<std::string> &args) -> Invocation;

void print_usage(std::ostream &os);

// Run one invocation from `cwd`. Returns the process exit code:
// 0 success, 1 fatal error, 2 usage error.
int run(const std::vector<std::string> &args, const std::filesystem::path &cwd,
        std::ostream &out, std::ostream &err, bool stdout_is_tty);

} // namespace changeview::cli
