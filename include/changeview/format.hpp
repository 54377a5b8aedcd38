#pragma once
#include "changeview/change.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace changeview::format {

struct ColumnWidths {
  std::size_t loc = 1;
  std::size_t insertions = 1;
  std::size_t deletions = 1;

  // Widen to fit one row.
  void fit(const std::optional<std::int64_t> &loc_value, std::int64_t ins, std::int64_t dels);
};

auto loc_text(const std::optional<std::int64_t> &loc) -> std::string;

// "<loc>  +<ins> -<dels>", each column right-aligned to `widths`.
// With color the +/- columns are wrapped in green/red escapes.
auto stats_aligned(const std::optional<std::int64_t> &loc, std::int64_t ins, std::int64_t dels,
                   const ColumnWidths &widths, bool use_color) -> std::string;

// Flat list: padded path, two spaces, stats. Empty input gives no lines.
std::vector<std::string> to_flat(const std::vector<ChangeRecord> &changes, bool use_color);

// Number of displayed characters (UTF-8 code points).
auto display_width(std::string_view text) -> std::size_t;

// Left-justify / right-justify to `width` displayed characters.
auto pad_right(std::string_view text, std::size_t width) -> std::string;
auto pad_left(std::string_view text, std::size_t width) -> std::string;

// Remove ANSI SGR escape sequences.
auto strip_ansi(std::string_view text) -> std::string;

} // namespace changeview::format
