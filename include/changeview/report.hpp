#pragma once
#include "changeview/change.hpp"
#include "changeview/repo.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace changeview::report {

struct Summary {
  std::int64_t total_insertions = 0;
  std::int64_t total_deletions = 0;
  std::int64_t net = 0;
  std::size_t file_count = 0;
};

auto summarize(const std::vector<ChangeRecord> &changes) -> Summary;

// {"mode", "files": [{path, loc, insertions, deletions}], "summary", "base"?}
auto to_json(const std::vector<ChangeRecord> &changes, Mode mode,
             const std::optional<std::string> &base) -> nlohmann::ordered_json;

// "Total: +13 -5 (net: +8)"
auto totals_line(const Summary &summary) -> std::string;
// "Files: 2"
auto files_line(const Summary &summary) -> std::string;

// "", "Compare:", "    <base>", "    <head>"
std::vector<std::string> comparison_lines(const ComparisonInfo &info);

// Tree (or flat list), blank line, totals, file count, then the comparison
// footer when `comparison` is set.
std::vector<std::string> text_lines(const std::vector<ChangeRecord> &changes, bool flat,
                                    bool use_color,
                                    const std::optional<ComparisonInfo> &comparison);

} // namespace changeview::report
