#include "changeview/tree.hpp"

#include "changeview/consts.hpp"
#include "changeview/format.hpp"
#include "changeview/util.hpp"

#include <algorithm>

namespace {

using changeview::TreeNode;

// A rendered row before alignment. Directory rows have no stats.
struct TreeLine {
  std::string text;
  bool has_stats = false;
  std::optional<std::int64_t> loc;
  std::int64_t insertions = 0;
  std::int64_t deletions = 0;
};

// Map order is (is_file, name): directories first, each group by byte order.
std::vector<const TreeNode *> sorted_children(const TreeNode &node) {
  std::vector<const TreeNode *> out;
  out.reserve(node.children.size());
  for (const auto &[_, child] : node.children)
    out.push_back(child.get());
  return out;
}

void collect_lines(const TreeNode &node, const std::string &prefix, std::vector<TreeLine> &out) {
  namespace consts = changeview::consts;
  const auto children = sorted_children(node);
  for (std::size_t i = 0; i < children.size(); ++i) {
    const TreeNode &child = *children[i];
    const bool is_last = i + 1 == children.size();
    std::string text = prefix;
    text += is_last ? consts::kCorner : consts::kBranch;
    text += child.name;

    if (child.is_file) {
      out.push_back(TreeLine{.text = std::move(text),
                             .has_stats = true,
                             .loc = child.loc,
                             .insertions = child.insertions,
                             .deletions = child.deletions});
    } else {
      text += '/';
      out.push_back(TreeLine{.text = std::move(text)});
      std::string extension = prefix;
      extension += is_last ? consts::kBlankIndent : consts::kPipeIndent;
      collect_lines(child, extension, out);
    }
  }
}

} // namespace

namespace changeview {

TreeNode build_tree(const std::vector<ChangeRecord> &changes) {
  TreeNode root;
  root.name = std::string(consts::kRootName);

  for (const auto &change : changes) {
    const auto parts = strutil::split(change.path, '/');
    TreeNode *node = &root;
    for (std::size_t i = 0; i < parts.size(); ++i) {
      const bool is_file = i + 1 == parts.size();
      const std::string part(parts[i]);
      auto &slot = node->children[TreeKey{is_file, part}];
      if (!slot) {
        slot = std::make_unique<TreeNode>();
        slot->name = part;
        slot->is_file = is_file;
        if (is_file) {
          slot->insertions = change.insertions;
          slot->deletions = change.deletions;
          slot->loc = change.loc;
        }
      }
      node = slot.get();
    }
  }
  return root;
}

std::vector<std::string> render_tree(const TreeNode &root, bool use_color) {
  std::vector<TreeLine> lines;
  collect_lines(root, "", lines);

  std::vector<std::string> out;
  if (lines.empty())
    return out;

  // Widths are global so columns line up across every depth.
  std::size_t text_width = 0;
  format::ColumnWidths widths;
  for (const auto &line : lines) {
    if (!line.has_stats)
      continue;
    text_width = std::max(text_width, format::display_width(line.text));
    widths.fit(line.loc, line.insertions, line.deletions);
  }

  out.reserve(lines.size());
  for (const auto &line : lines) {
    if (!line.has_stats) {
      out.push_back(line.text);
      continue;
    }
    out.push_back(format::pad_right(line.text, text_width) + "  " +
                  format::stats_aligned(line.loc, line.insertions, line.deletions, widths,
                                        use_color));
  }
  return out;
}

} // namespace changeview
