#include "changeview/format.hpp"

#include "changeview/consts.hpp"
#include "changeview/util.hpp"

#include <algorithm>

namespace changeview::format {

void ColumnWidths::fit(const std::optional<std::int64_t> &loc_value, std::int64_t ins,
                       std::int64_t dels) {
  loc = std::max(loc, loc_text(loc_value).size());
  insertions = std::max(insertions, std::to_string(ins).size());
  deletions = std::max(deletions, std::to_string(dels).size());
}

std::string loc_text(const std::optional<std::int64_t> &loc) {
  return loc ? std::to_string(*loc) : std::string(consts::kNoLoc);
}

std::string stats_aligned(const std::optional<std::int64_t> &loc, std::int64_t ins,
                          std::int64_t dels, const ColumnWidths &widths, bool use_color) {
  const std::string loc_col = pad_left(loc_text(loc), widths.loc);
  const std::string ins_col = "+" + pad_left(std::to_string(ins), widths.insertions);
  const std::string del_col = "-" + pad_left(std::to_string(dels), widths.deletions);

  std::string out = loc_col + "  ";
  if (use_color) {
    out.append(consts::kGreen).append(ins_col).append(consts::kReset);
    out += ' ';
    out.append(consts::kRed).append(del_col).append(consts::kReset);
  } else {
    out += ins_col + " " + del_col;
  }
  return out;
}

std::vector<std::string> to_flat(const std::vector<ChangeRecord> &changes, bool use_color) {
  std::vector<std::string> lines;
  if (changes.empty())
    return lines;

  std::size_t path_width = 0;
  ColumnWidths widths;
  for (const auto &c : changes) {
    path_width = std::max(path_width, display_width(c.path));
    widths.fit(c.loc, c.insertions, c.deletions);
  }

  lines.reserve(changes.size());
  for (const auto &c : changes) {
    lines.push_back(pad_right(c.path, path_width) + "  " +
                    stats_aligned(c.loc, c.insertions, c.deletions, widths, use_color));
  }
  return lines;
}

std::size_t display_width(std::string_view text) { return strutil::utf8_length(text); }

std::string pad_right(std::string_view text, std::size_t width) {
  std::string out(text);
  const auto w = display_width(text);
  if (w < width)
    out.append(width - w, ' ');
  return out;
}

std::string pad_left(std::string_view text, std::size_t width) {
  const auto w = display_width(text);
  std::string out;
  if (w < width)
    out.assign(width - w, ' ');
  out += text;
  return out;
}

std::string strip_ansi(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[') {
      std::size_t j = i + 2;
      while (j < text.size() && text[j] != 'm')
        ++j;
      i = j;
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

} // namespace changeview::format
