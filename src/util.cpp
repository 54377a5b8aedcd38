// String and line-count helpers
#include "changeview/util.hpp"

#include "changeview/consts.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr unsigned char kUtf8ContinuationMask = 0xC0;
constexpr unsigned char kUtf8ContinuationByte = 0x80;

bool is_continuation(char c) {
  return (static_cast<unsigned char>(c) & kUtf8ContinuationMask) == kUtf8ContinuationByte;
}

} // namespace

namespace changeview {

std::optional<std::int64_t> count_lines(std::string_view content, LineEnding ending) {
  const auto sniff = content.substr(0, consts::kBinarySniffLen);
  if (sniff.find(consts::kNul) != std::string_view::npos) {
    return std::nullopt;
  }
  if (ending == LineEnding::LF) {
    auto n = static_cast<std::int64_t>(std::ranges::count(content, consts::kLF));
    if (!content.empty() && content.back() != consts::kLF) {
      ++n;
    }
    return n;
  }

  std::int64_t n = 0;
  for (std::size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    if (c == consts::kLF) {
      ++n;
    } else if (c == consts::kCR) {
      ++n;
      if (i + 1 < content.size() && content[i + 1] == consts::kLF)
        ++i;
    }
  }
  if (!content.empty() && content.back() != consts::kLF && content.back() != consts::kCR) {
    ++n;
  }
  return n;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    sv.remove_suffix(1);
  return std::string(sv);
}

bool is_blank(std::string_view sv) {
  return std::ranges::all_of(sv, [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

std::vector<std::string_view> split(std::string_view sv, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = sv.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(sv.substr(start));
      break;
    }
    parts.push_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string to_lower(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string utf8_prefix(std::string_view sv, std::size_t n) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < sv.size(); ++i) {
    if (!is_continuation(sv[i])) {
      if (seen == n)
        return std::string(sv.substr(0, i));
      ++seen;
    }
  }
  return std::string(sv);
}

std::size_t utf8_length(std::string_view sv) {
  return static_cast<std::size_t>(
      std::ranges::count_if(sv, [](char c) { return !is_continuation(c); }));
}

} // namespace strutil

} // namespace changeview
