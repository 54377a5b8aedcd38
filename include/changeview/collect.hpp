#pragma once
#include "changeview/change.hpp"
#include "changeview/consts.hpp"
#include "changeview/repo.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace changeview {

// Numstat for `mode`, normalized and enriched with current line counts.
// Throws MergeBaseNotFound, InsufficientHistory or GitCommandError.
auto collect_changes(const Repository &repo, Mode mode,
                     std::string_view base_branch = consts::kDefaultBase)
    -> std::vector<ChangeRecord>;

// Line-count lookup bound to the comparison target of `mode`.
auto line_counter(const Repository &repo, Mode mode) -> LineCountLookup;

// Reference the changes are measured from: "HEAD", "HEAD~1" or the merge base id.
auto base_ref(const Repository &repo, Mode mode,
              std::string_view base_branch = consts::kDefaultBase)
    -> std::optional<std::string>;

// Commit descriptors for the footer. Throws on any lookup failure.
auto comparison_info(const Repository &repo, Mode mode,
                     std::string_view base_branch = consts::kDefaultBase) -> ComparisonInfo;

} // namespace changeview
