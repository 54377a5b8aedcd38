#pragma once
#include "changeview/change.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace changeview {

// (is_file, name): a file and a directory of the same name are distinct
// siblings, and map order puts directories first.
using TreeKey = std::pair<bool, std::string>;

struct TreeNode {
  std::string name;  // single path segment; "." for the root
  bool is_file = false;
  std::int64_t insertions = 0;
  std::int64_t deletions = 0;
  std::optional<std::int64_t> loc;
  std::map<TreeKey, std::unique_ptr<TreeNode>> children;
};

// Group records into a directory tree keyed by '/'-separated segments.
// Paths are taken as-is; no "." / ".." handling.
auto build_tree(const std::vector<ChangeRecord> &changes) -> TreeNode;

// Render the tree with box-drawing connectors. Directories sort before files,
// each group by name; stats columns are aligned across the whole tree.
std::vector<std::string> render_tree(const TreeNode &root, bool use_color);

} // namespace changeview
