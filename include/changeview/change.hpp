#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace changeview {

// What the change set is measured against.
enum class Mode : std::uint8_t { Default, SinceLast, Uncommitted };

enum class SortKey : std::uint8_t { Name, Changes, Path };

struct ChangeRecord {
  std::string path;                 // repo-relative, '/' separated
  std::int64_t insertions = 0;
  std::int64_t deletions = 0;
  std::optional<std::int64_t> loc;  // current line count; empty if file is gone or unreadable

  [[nodiscard]] auto net() const -> std::int64_t { return insertions - deletions; }
  [[nodiscard]] auto total() const -> std::int64_t { return insertions + deletions; }
};

using LineCountLookup = std::function<std::optional<std::int64_t>(const std::string &path)>;

// "default", "since-last", "uncommitted"
auto mode_name(Mode mode) -> std::string_view;

auto parse_sort_key(std::string_view text) -> std::optional<SortKey>;

// Stable sort:
//   Name    - last path segment, case-insensitive
//   Changes - descending insertions + deletions
//   Path    - full path ascending
void sort_changes(std::vector<ChangeRecord> &changes, SortKey key);

// Fill `loc` for every record from `lookup`. A throwing lookup leaves `loc` empty.
void enrich(std::vector<ChangeRecord> &changes, const LineCountLookup &lookup);

} // namespace changeview
