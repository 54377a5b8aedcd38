#include "cli/app.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

int main(int argc, char **argv) {
  // Pass everything after the program name to the handler
  const std::vector<std::string> args(argv + 1, argv + argc);

  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    std::cerr << "Error: cannot determine current directory: " << ec.message() << "\n";
    return 1;
  }
  return changeview::cli::run(args, cwd, std::cout, std::cerr, ::isatty(STDOUT_FILENO) == 1);
}
