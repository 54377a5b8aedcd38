#pragma once
#include "changeview/change.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace changeview::numstat {

// Parse `git diff --numstat` output: "<ins>\t<del>\t<path>" per line.
// Binary entries ("-") count as 0; renames resolve to the new path.
// Lines with fewer than three fields are skipped. Throws std::runtime_error
// on a count that is neither "-" nor a non-negative integer.
std::vector<ChangeRecord> parse(std::string_view text);

// "{old => new}/f.txt" -> "new/f.txt", "a => b" -> "b"; other paths unchanged.
std::string resolve_rename(std::string_view path);

} // namespace changeview::numstat
