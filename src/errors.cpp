#include "changeview/errors.hpp"

#include "changeview/util.hpp"

namespace changeview {

GitCommandError::GitCommandError(const std::string &command, int exit_code,
                                 std::string stderr_text)
    : Error(command + " failed (exit " + std::to_string(exit_code) + ")" +
            (strutil::trim(stderr_text).empty() ? "" : ": " + strutil::trim(stderr_text))),
      exit_code_(exit_code), stderr_(std::move(stderr_text)) {}

} // namespace changeview
