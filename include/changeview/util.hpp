#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace changeview {

enum class LineEnding {
  LF,        // only '\n' ends a line (blob contents)
  Universal, // '\n', '\r\n' and a lone '\r' each end a line (working-tree files)
};

// Lines in `content`: terminator count, plus one for an unterminated last line.
// nullopt when the content looks binary (NUL in the first 8000 bytes).
auto count_lines(std::string_view content, LineEnding ending = LineEnding::LF)
    -> std::optional<std::int64_t>;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  auto trim(std::string_view sv) -> std::string;
  auto is_blank(std::string_view sv) -> bool;
  auto split(std::string_view sv, char sep) -> std::vector<std::string_view>;
  auto to_lower(std::string_view sv) -> std::string;

  // First `n` UTF-8 code points of `sv`.
  auto utf8_prefix(std::string_view sv, std::size_t n) -> std::string;
  auto utf8_length(std::string_view sv) -> std::size_t;
}

}
