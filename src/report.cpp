#include "changeview/report.hpp"

#include "changeview/format.hpp"
#include "changeview/tree.hpp"

namespace changeview::report {

Summary summarize(const std::vector<ChangeRecord> &changes) {
  Summary s;
  for (const auto &c : changes) {
    s.total_insertions += c.insertions;
    s.total_deletions += c.deletions;
  }
  s.net = s.total_insertions - s.total_deletions;
  s.file_count = changes.size();
  return s;
}

nlohmann::ordered_json to_json(const std::vector<ChangeRecord> &changes, Mode mode,
                               const std::optional<std::string> &base) {
  nlohmann::ordered_json files = nlohmann::ordered_json::array();
  for (const auto &c : changes) {
    nlohmann::ordered_json entry;
    entry["path"] = c.path;
    if (c.loc)
      entry["loc"] = *c.loc;
    else
      entry["loc"] = nullptr;
    entry["insertions"] = c.insertions;
    entry["deletions"] = c.deletions;
    files.push_back(std::move(entry));
  }

  const Summary s = summarize(changes);
  nlohmann::ordered_json doc;
  doc["mode"] = std::string(mode_name(mode));
  doc["files"] = std::move(files);
  doc["summary"] = {
      {"total_insertions", s.total_insertions},
      {"total_deletions", s.total_deletions},
      {"net", s.net},
      {"file_count", s.file_count},
  };
  if (base && !base->empty())
    doc["base"] = *base;
  return doc;
}

std::string totals_line(const Summary &summary) {
  const std::string sign = summary.net >= 0 ? "+" : "";
  return "Total: +" + std::to_string(summary.total_insertions) + " -" +
         std::to_string(summary.total_deletions) + " (net: " + sign +
         std::to_string(summary.net) + ")";
}

std::string files_line(const Summary &summary) {
  return "Files: " + std::to_string(summary.file_count);
}

std::vector<std::string> comparison_lines(const ComparisonInfo &info) {
  std::vector<std::string> lines{"", "Compare:"};
  if (info.base)
    lines.push_back("    " + info.base->describe());
  lines.push_back("    " + info.head_line());
  return lines;
}

std::vector<std::string> text_lines(const std::vector<ChangeRecord> &changes, bool flat,
                                    bool use_color,
                                    const std::optional<ComparisonInfo> &comparison) {
  std::vector<std::string> lines =
      flat ? format::to_flat(changes, use_color) : render_tree(build_tree(changes), use_color);

  const Summary s = summarize(changes);
  lines.emplace_back();
  lines.push_back(totals_line(s));
  lines.push_back(files_line(s));

  if (comparison) {
    auto footer = comparison_lines(*comparison);
    lines.insert(lines.end(), footer.begin(), footer.end());
  }
  return lines;
}

} // namespace changeview::report
