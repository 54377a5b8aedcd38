#include "changeview/collect.hpp"

#include "changeview/errors.hpp"
#include "changeview/numstat.hpp"

namespace changeview {

LineCountLookup line_counter(const Repository &repo, Mode mode) {
  if (mode == Mode::Uncommitted) {
    return [&repo](const std::string &path) { return repo.worktree_lines(path); };
  }
  return [&repo](const std::string &path) { return repo.blob_lines(path); };
}

std::vector<ChangeRecord> collect_changes(const Repository &repo, Mode mode,
                                          std::string_view base_branch) {
  std::string raw;
  switch (mode) {
  case Mode::Uncommitted:
    // staged + unstaged vs HEAD
    raw = repo.numstat(consts::kHead, "");
    break;
  case Mode::SinceLast:
    if (!repo.resolve(consts::kHeadParent))
      throw InsufficientHistory("HEAD has no parent commit");
    raw = repo.numstat(consts::kHeadParent, consts::kHead);
    break;
  case Mode::Default:
    raw = repo.numstat(repo.merge_base(base_branch), consts::kHead);
    break;
  }

  auto changes = numstat::parse(raw);
  enrich(changes, line_counter(repo, mode));
  return changes;
}

std::optional<std::string> base_ref(const Repository &repo, Mode mode,
                                    std::string_view base_branch) {
  switch (mode) {
  case Mode::Uncommitted:
    return std::string(consts::kHead);
  case Mode::SinceLast:
    return std::string(consts::kHeadParent);
  case Mode::Default:
    break;
  }
  try {
    return repo.merge_base(base_branch);
  } catch (const MergeBaseNotFound &) {
    return std::nullopt;
  }
}

ComparisonInfo comparison_info(const Repository &repo, Mode mode, std::string_view base_branch) {
  switch (mode) {
  case Mode::Uncommitted:
    return ComparisonInfo{.base = repo.commit_info(consts::kHead),
                          .head = std::string(consts::kUncommitted)};
  case Mode::SinceLast:
    return ComparisonInfo{.base = repo.commit_info(consts::kHeadParent),
                          .head = repo.commit_info(consts::kHead)};
  case Mode::Default:
    break;
  }
  const std::string base = repo.merge_base(base_branch);
  return ComparisonInfo{.base = repo.commit_info(base), .head = repo.commit_info(consts::kHead)};
}

} // namespace changeview
