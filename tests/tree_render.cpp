#include "changeview/format.hpp"
#include "changeview/tree.hpp"

#include <iostream>
#include <string>
#include <vector>

using changeview::ChangeRecord;

static void dump(const std::vector<std::string> &lines) {
  for (const auto &l : lines)
    std::cerr << "  [" << l << "]\n";
}

int main() {
  const std::vector<ChangeRecord> changes{
      {.path = "zeta.py", .insertions = 1, .deletions = 0, .loc = 5},
      {.path = "src/util/strings.cpp", .insertions = 120, .deletions = 4, .loc = 300},
      {.path = "src/main.cpp", .insertions = 2, .deletions = 1, .loc = 40},
      {.path = "README.md", .insertions = 3, .deletions = 10},
      {.path = "src/app/run.cpp", .insertions = 7, .deletions = 0, .loc = 12},
  };
  const auto lines = changeview::render_tree(changeview::build_tree(changes), false);

  // directories first, then files, each group by byte order
  const std::vector<std::string> expected{
      "├── src/",
      "│   ├── app/",
      "│   │   └── run.cpp       12  +  7 - 0",
      "│   ├── util/",
      "│   │   └── strings.cpp  300  +120 - 4",
      "│   └── main.cpp          40  +  2 - 1",
      "├── README.md              -  +  3 -10",
      "└── zeta.py                5  +  1 - 0",
  };

  if (lines != expected) {
    std::cerr << "tree render mismatch, got:\n";
    dump(lines);
    std::cerr << "expected:\n";
    dump(expected);
    return 1;
  }

  // every stats row starts its stats at the same display column
  std::size_t col = 0;
  for (const auto &l : lines) {
    const auto plus = l.find("  +");
    if (plus == std::string::npos)
      continue;
    const auto w = changeview::format::display_width(l.substr(0, plus));
    if (col == 0)
      col = w;
    else if (w != col) {
      std::cerr << "stats columns not aligned\n";
      dump(lines);
      return 1;
    }
  }

  // colored output is the plain output plus escapes
  const auto colored = changeview::render_tree(changeview::build_tree(changes), true);
  if (colored.size() != lines.size()) {
    std::cerr << "colored line count differs\n";
    return 1;
  }
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (changeview::format::strip_ansi(colored[i]) != lines[i]) {
      std::cerr << "colored line differs after stripping: " << colored[i] << "\n";
      return 1;
    }
  }
  if (colored[2].find("\033[32m+") == std::string::npos ||
      colored[2].find("\033[31m-") == std::string::npos) {
    std::cerr << "colored stats missing escapes\n";
    return 1;
  }
  if (colored[0].find('\033') != std::string::npos) {
    std::cerr << "directory rows should not be colored\n";
    return 1;
  }

  // last sibling uses the corner connector
  {
    const auto two = changeview::render_tree(
        changeview::build_tree({{.path = "b.txt"}, {.path = "a.txt"}}), false);
    if (two.size() != 2 || two[0].rfind("├── a.txt", 0) != 0 ||
        two[1].rfind("└── b.txt", 0) != 0) {
      std::cerr << "connector mismatch\n";
      dump(two);
      return 1;
    }
  }

  // a directory that is the last sibling indents its children with blanks
  {
    const auto nested = changeview::render_tree(
        changeview::build_tree({{.path = "only/inner/f.txt", .insertions = 1}}), false);
    const std::vector<std::string> want_nested{
        "└── only/",
        "    └── inner/",
        "        └── f.txt  -  +1 -0",
    };
    if (nested != want_nested) {
      std::cerr << "nested blank indent mismatch\n";
      dump(nested);
      return 1;
    }
  }

  // a path that is a file on one side and a directory on the other renders both
  {
    const ChangeRecord removed{.path = "docs", .insertions = 0, .deletions = 4};
    const ChangeRecord added{.path = "docs/guide.md", .insertions = 1, .deletions = 0, .loc = 1};
    const std::vector<std::string> want{
        "├── docs/",
        "│   └── guide.md  1  +1 -0",
        "└── docs          -  +0 -4",
    };
    for (const auto &input : {std::vector<ChangeRecord>{removed, added},
                              std::vector<ChangeRecord>{added, removed}}) {
      const auto got = changeview::render_tree(changeview::build_tree(input), false);
      if (got != want) {
        std::cerr << "file/directory name clash mismatch\n";
        dump(got);
        return 1;
      }
    }
  }

  if (!changeview::render_tree(changeview::build_tree({}), false).empty()) {
    std::cerr << "empty tree should render nothing\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
