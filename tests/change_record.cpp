#include "changeview/change.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

using changeview::ChangeRecord;

static std::vector<std::string> paths(const std::vector<ChangeRecord> &xs) {
  std::vector<std::string> out;
  for (const auto &c : xs)
    out.push_back(c.path);
  return out;
}

int main() {
  // net / total
  {
    const ChangeRecord up{.path = "test.py", .insertions = 10, .deletions = 3};
    if (up.net() != 7 || up.total() != 13) {
      std::cerr << "net/total mismatch: " << up.net() << " " << up.total() << "\n";
      return 1;
    }
    const ChangeRecord down{.path = "test.py", .insertions = 3, .deletions = 10};
    if (down.net() != -7 || down.total() != 13) {
      std::cerr << "negative net mismatch: " << down.net() << "\n";
      return 1;
    }
    const ChangeRecord even{.path = "test.py", .insertions = 5, .deletions = 5};
    if (even.net() != 0) {
      std::cerr << "zero net mismatch\n";
      return 1;
    }
  }

  const std::vector<ChangeRecord> base{
      {.path = "src/Zeta.cpp", .insertions = 1, .deletions = 1},
      {.path = "docs/alpha.md", .insertions = 10, .deletions = 5},
      {.path = "beta.txt", .insertions = 3, .deletions = 0},
      {.path = "lib/beta.txt", .insertions = 20, .deletions = 0},
  };

  // name: last segment, case-insensitive, stable for ties
  {
    auto xs = base;
    changeview::sort_changes(xs, changeview::SortKey::Name);
    const std::vector<std::string> want{"docs/alpha.md", "beta.txt", "lib/beta.txt",
                                        "src/Zeta.cpp"};
    if (paths(xs) != want) {
      std::cerr << "name sort mismatch\n";
      return 1;
    }
  }
  // changes: descending total
  {
    auto xs = base;
    changeview::sort_changes(xs, changeview::SortKey::Changes);
    const std::vector<std::string> want{"lib/beta.txt", "docs/alpha.md", "beta.txt",
                                        "src/Zeta.cpp"};
    if (paths(xs) != want) {
      std::cerr << "changes sort mismatch\n";
      return 1;
    }
  }
  // path: full path ascending
  {
    auto xs = base;
    changeview::sort_changes(xs, changeview::SortKey::Path);
    const std::vector<std::string> want{"beta.txt", "docs/alpha.md", "lib/beta.txt",
                                        "src/Zeta.cpp"};
    if (paths(xs) != want) {
      std::cerr << "path sort mismatch\n";
      return 1;
    }
  }

  // sort key names
  if (changeview::parse_sort_key("changes") != changeview::SortKey::Changes ||
      changeview::parse_sort_key("bogus").has_value() ||
      changeview::parse_sort_key("path") != changeview::SortKey::Path) {
    std::cerr << "sort key parsing mismatch\n";
    return 1;
  }
  if (changeview::mode_name(changeview::Mode::SinceLast) != "since-last" ||
      changeview::mode_name(changeview::Mode::Uncommitted) != "uncommitted" ||
      changeview::mode_name(changeview::Mode::Default) != "default") {
    std::cerr << "mode names mismatch\n";
    return 1;
  }

  // enrichment: lookup results assigned per path, failures become absent
  {
    auto xs = base;
    changeview::enrich(xs, [](const std::string &path) -> std::optional<std::int64_t> {
      if (path == "beta.txt")
        return std::nullopt;
      if (path == "lib/beta.txt")
        throw std::runtime_error("unreadable");
      return static_cast<std::int64_t>(path.size());
    });
    if (xs[0].loc != std::optional<std::int64_t>(12) || xs[1].loc != 13) {
      std::cerr << "enrich did not assign counts\n";
      return 1;
    }
    if (xs[2].loc.has_value() || xs[3].loc.has_value()) {
      std::cerr << "enrich should leave missing/failed counts empty\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
