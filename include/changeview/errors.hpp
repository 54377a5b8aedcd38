#pragma once
#include <stdexcept>
#include <string>

namespace changeview {

// Base for every fatal condition the CLI reports with exit code 1.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class RepositoryNotFound : public Error {
public:
  using Error::Error;
};

class EmptyRepository : public Error {
public:
  using Error::Error;
};

class MergeBaseNotFound : public Error {
public:
  using Error::Error;
};

class InsufficientHistory : public Error {
public:
  using Error::Error;
};

// A git invocation exited non-zero. `stderr_text()` is git's own message.
class GitCommandError : public Error {
public:
  GitCommandError(const std::string &command, int exit_code, std::string stderr_text);

  [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
  [[nodiscard]] const std::string &stderr_text() const noexcept { return stderr_; }

private:
  int exit_code_;
  std::string stderr_;
};

} // namespace changeview
