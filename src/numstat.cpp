#include "changeview/numstat.hpp"

#include "changeview/consts.hpp"
#include "changeview/util.hpp"

#include <charconv>
#include <stdexcept>

namespace {

std::int64_t parse_count(std::string_view field) {
  if (field == changeview::consts::kBinaryMarker)
    return 0;
  std::int64_t value = 0;
  const auto *first = field.data();
  const auto *last = field.data() + field.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (field.empty() || ec != std::errc{} || ptr != last || value < 0) {
    throw std::runtime_error("numstat: invalid count '" + std::string(field) + "'");
  }
  return value;
}

// Right-hand side of the first " => " in `sv` (up to a second arrow, if any).
std::string_view rhs_of_arrow(std::string_view sv) {
  const auto arrow = changeview::consts::kRenameArrow;
  const auto pos = sv.find(arrow);
  if (pos == std::string_view::npos)
    return sv;
  auto rest = sv.substr(pos + arrow.size());
  if (const auto next = rest.find(arrow); next != std::string_view::npos)
    rest = rest.substr(0, next);
  return rest;
}

void collapse_slashes(std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    if (c == '/' && !out.empty() && out.back() == '/')
      continue;
    out.push_back(c);
  }
  if (!out.empty() && out.front() == '/')
    out.erase(0, 1);
  s = std::move(out);
}

} // namespace

namespace changeview::numstat {

std::string resolve_rename(std::string_view path) {
  if (path.find(consts::kRenameArrow) == std::string_view::npos)
    return std::string(path);

  const auto open = path.find('{');
  const auto close = open == std::string_view::npos ? std::string_view::npos
                                                    : path.find('}', open);
  if (open != std::string_view::npos && close != std::string_view::npos) {
    // prefix/{old => new}/suffix
    const auto inner = path.substr(open + 1, close - open - 1);
    if (inner.find(consts::kRenameArrow) != std::string_view::npos) {
      std::string out(path.substr(0, open));
      out += rhs_of_arrow(inner);
      out += path.substr(close + 1);
      collapse_slashes(out);
      return out;
    }
  }

  // old/full/path => new/full/path
  std::string stripped;
  stripped.reserve(path.size());
  for (const char c : path) {
    if (c != '{' && c != '}')
      stripped.push_back(c);
  }
  return std::string(rhs_of_arrow(stripped));
}

std::vector<ChangeRecord> parse(std::string_view text) {
  std::vector<ChangeRecord> out;
  if (strutil::is_blank(text))
    return out;

  for (const auto raw : strutil::split(text, consts::kLF)) {
    std::string line(raw);
    strutil::rstrip_newlines(line);
    if (line.empty())
      continue;

    const std::string_view sv{line};
    const auto tab1 = sv.find(consts::kFieldSep);
    if (tab1 == std::string_view::npos)
      continue;
    const auto tab2 = sv.find(consts::kFieldSep, tab1 + 1);
    if (tab2 == std::string_view::npos)
      continue;

    ChangeRecord rec;
    rec.insertions = parse_count(sv.substr(0, tab1));
    rec.deletions = parse_count(sv.substr(tab1 + 1, tab2 - tab1 - 1));
    rec.path = resolve_rename(sv.substr(tab2 + 1));
    if (rec.path.empty())
      continue;
    out.push_back(std::move(rec));
  }
  return out;
}

} // namespace changeview::numstat
