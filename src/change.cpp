#include "changeview/change.hpp"

#include "changeview/util.hpp"

#include <algorithm>
#include <exception>

namespace {

std::string_view last_segment(std::string_view path) {
  const auto pos = path.rfind('/');
  return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace

namespace changeview {

std::string_view mode_name(Mode mode) {
  switch (mode) {
  case Mode::SinceLast:
    return "since-last";
  case Mode::Uncommitted:
    return "uncommitted";
  case Mode::Default:
    break;
  }
  return "default";
}

std::optional<SortKey> parse_sort_key(std::string_view text) {
  if (text == "name")
    return SortKey::Name;
  if (text == "changes")
    return SortKey::Changes;
  if (text == "path")
    return SortKey::Path;
  return std::nullopt;
}

void sort_changes(std::vector<ChangeRecord> &changes, SortKey key) {
  switch (key) {
  case SortKey::Changes:
    std::ranges::stable_sort(changes, [](const ChangeRecord &a, const ChangeRecord &b) {
      return a.total() > b.total();
    });
    break;
  case SortKey::Path:
    std::ranges::stable_sort(changes, {}, &ChangeRecord::path);
    break;
  case SortKey::Name:
    std::ranges::stable_sort(changes, {}, [](const ChangeRecord &c) {
      return strutil::to_lower(last_segment(c.path));
    });
    break;
  }
}

void enrich(std::vector<ChangeRecord> &changes, const LineCountLookup &lookup) {
  for (auto &change : changes) {
    try {
      change.loc = lookup(change.path);
    } catch (const std::exception &) {
      change.loc.reset(); // unreadable counts as absent
    }
  }
}

} // namespace changeview
