#include "changeview/format.hpp"

#include <iostream>
#include <optional>
#include <vector>

using changeview::format::ColumnWidths;
using changeview::format::stats_aligned;

int main() {
  // widths follow the widest formatted value, floor of 1
  {
    ColumnWidths w;
    if (w.loc != 1 || w.insertions != 1 || w.deletions != 1) {
      std::cerr << "width floor should be 1\n";
      return 1;
    }
    const std::vector<std::optional<std::int64_t>> locs{std::nullopt, 7, 123};
    for (const auto &loc : locs)
      w.fit(loc, 5, 0);
    if (w.loc != 3) {
      std::cerr << "loc width should be 3, got " << w.loc << "\n";
      return 1;
    }
    const auto absent = stats_aligned(std::nullopt, 5, 0, w, false);
    if (absent != "  -  +5 -0") {
      std::cerr << "absent row mismatch: [" << absent << "]\n";
      return 1;
    }
    const auto seven = stats_aligned(7, 5, 0, w, false);
    if (seven != "  7  +5 -0") {
      std::cerr << "seven row mismatch: [" << seven << "]\n";
      return 1;
    }
  }

  // every column is right-aligned independently
  {
    ColumnWidths w;
    w.fit(1000, 42, 7);
    w.fit(3, 1, 1234);
    const auto s = stats_aligned(3, 1, 1234, w, false);
    if (s != "   3  + 1 -1234") {
      std::cerr << "alignment mismatch: [" << s << "]\n";
      return 1;
    }
  }

  // color wraps only the +/- segments
  {
    const ColumnWidths w{.loc = 2, .insertions = 2, .deletions = 1};
    const auto s = stats_aligned(9, 3, 4, w, true);
    if (s != " 9  \033[32m+ 3\033[0m \033[31m-4\033[0m") {
      std::cerr << "color layout mismatch\n";
      return 1;
    }
    if (changeview::format::strip_ansi(s) != stats_aligned(9, 3, 4, w, false)) {
      std::cerr << "stripped color differs from plain\n";
      return 1;
    }
  }

  // display width counts code points
  if (changeview::format::display_width("└── ä.txt") != 9 ||
      changeview::format::pad_right("é", 3) != "é  " ||
      changeview::format::pad_left("7", 3) != "  7") {
    std::cerr << "display width helpers mismatch\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
