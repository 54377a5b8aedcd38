#pragma once
#include "changeview/consts.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace changeview {

struct CommitInfo {
  std::string short_hash;  // first 6 hex chars
  std::string message;     // first line, trimmed
  std::string date;        // YYYY-MM-DD HH:MM:SS in the commit's timezone

  // "2024-01-02 03:04:05 abc123 subject", subject cut to fit `max_msg_len`.
  [[nodiscard]] auto describe(std::size_t max_msg_len = consts::kMaxMessageLen) const
      -> std::string;
};

struct ComparisonInfo {
  std::optional<CommitInfo> base;
  std::variant<CommitInfo, std::string> head;  // string: working tree sentinel

  [[nodiscard]] auto head_line() const -> std::string;
};

// Thin access layer over the `git` executable for one working tree.
class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Walk `start` and its parents looking for .git. Throws RepositoryNotFound.
  static auto discover(const std::filesystem::path &start) -> Repository;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  [[nodiscard]] auto has_commits() const -> bool;

  // Full commit id for `ref`, or nullopt if it does not name a commit.
  [[nodiscard]] auto resolve(std::string_view ref) const -> std::optional<std::string>;

  // Candidate branches tried for the merge base, in order.
  [[nodiscard]] static auto base_candidates(std::string_view target) -> std::vector<std::string>;

  // First merge base of HEAD with `target`, origin/<target>, master, origin/master.
  // Throws MergeBaseNotFound.
  [[nodiscard]] auto merge_base(std::string_view target = consts::kDefaultBase) const
      -> std::string;

  // Raw `git diff --numstat from [to]`. Empty `to` compares with the working tree.
  // Throws GitCommandError.
  [[nodiscard]] auto numstat(std::string_view from, std::string_view to) const -> std::string;

  // Line count of `path` at HEAD / in the working tree; nullopt if absent or binary.
  [[nodiscard]] auto blob_lines(const std::string &path) const -> std::optional<std::int64_t>;
  [[nodiscard]] auto worktree_lines(const std::string &path) const
      -> std::optional<std::int64_t>;

  // Throws GitCommandError if `ref` cannot be read.
  [[nodiscard]] auto commit_info(std::string_view ref) const -> CommitInfo;

  // Runs `git -C <root> -c core.quotepath=off <args...>`; throws GitCommandError on failure.
  [[nodiscard]] auto git(const std::vector<std::string> &args) const -> std::string;

private:
  std::filesystem::path root_;
};

} // namespace changeview
