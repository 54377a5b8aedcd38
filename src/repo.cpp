#include "changeview/repo.hpp"

#include "changeview/consts.hpp"
#include "changeview/errors.hpp"
#include "changeview/fs.hpp"
#include "changeview/process.hpp"
#include "changeview/time.hpp"
#include "changeview/util.hpp"

#include <charconv>
#include <string>
#include <type_traits>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

constexpr char kUnitSep = '\x1f';

[[nodiscard]] auto base_command(const stdfs::path &root) -> std::vector<std::string> {
  return {std::string(changeview::consts::kGitProgram), "-C", root.string(), "-c",
          "core.quotepath=off"};
}

[[nodiscard]] auto first_line(std::string_view text) -> std::string {
  const auto nl = text.find('\n');
  return changeview::strutil::trim(nl == std::string_view::npos ? text : text.substr(0, nl));
}

} // namespace

namespace changeview {

std::string CommitInfo::describe(std::size_t max_msg_len) const {
  std::string msg = message;
  if (strutil::utf8_length(msg) > max_msg_len) {
    const std::size_t keep =
        max_msg_len > consts::kEllipsis.size() ? max_msg_len - consts::kEllipsis.size() : 0;
    msg = strutil::utf8_prefix(msg, keep);
    msg += consts::kEllipsis;
  }
  return date + " " + short_hash + " " + msg;
}

std::string ComparisonInfo::head_line() const {
  return std::visit(
      [](const auto &h) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(h)>, CommitInfo>)
          return h.describe();
        else
          return h;
      },
      head);
}

Repository::Repository(stdfs::path root) : root_(std::move(root)) {}

auto Repository::discover(const stdfs::path &start) -> Repository {
  std::error_code ec;
  stdfs::path dir = stdfs::weakly_canonical(start, ec);
  if (ec)
    dir = start;
  while (true) {
    if (fs::exists(dir / consts::kGitDir))
      return Repository{dir};
    const auto parent = dir.parent_path();
    if (parent.empty() || parent == dir)
      break;
    dir = parent;
  }
  throw RepositoryNotFound("not a git repository (or any parent): " + start.string());
}

std::string Repository::git(const std::vector<std::string> &args) const {
  auto argv = base_command(root_);
  argv.insert(argv.end(), args.begin(), args.end());
  auto res = process::run(argv, root_);
  if (!res.ok()) {
    std::string cmd = "git";
    for (const auto &a : args)
      cmd += " " + a;
    throw GitCommandError(cmd, res.exit_code, std::move(res.err));
  }
  return std::move(res.out);
}

auto Repository::has_commits() const -> bool {
  return resolve(consts::kHead).has_value();
}

auto Repository::resolve(std::string_view ref) const -> std::optional<std::string> {
  auto argv = base_command(root_);
  argv.insert(argv.end(),
              {"rev-parse", "--verify", "--quiet", std::string(ref) + "^{commit}"});
  auto res = process::run(argv, root_);
  if (!res.ok())
    return std::nullopt;
  std::string id = strutil::trim(res.out);
  if (id.empty())
    return std::nullopt;
  return id;
}

auto Repository::base_candidates(std::string_view target) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto add = [&out](std::string name) {
    for (const auto &existing : out)
      if (existing == name)
        return;
    out.push_back(std::move(name));
  };
  add(std::string(target));
  add(std::string(consts::kRemotePrefix) + std::string(target));
  add(std::string(consts::kFallbackBase));
  add(std::string(consts::kRemotePrefix) + std::string(consts::kFallbackBase));
  return out;
}

auto Repository::merge_base(std::string_view target) const -> std::string {
  const auto candidates = base_candidates(target);
  for (const auto &branch : candidates) {
    auto argv = base_command(root_);
    argv.insert(argv.end(), {"merge-base", std::string(consts::kHead), branch});
    const auto res = process::run(argv, root_);
    if (!res.ok())
      continue;
    std::string id = strutil::trim(res.out);
    if (!id.empty())
      return id;
  }
  std::string tried;
  for (const auto &c : candidates)
    tried += (tried.empty() ? "" : ", ") + c;
  throw MergeBaseNotFound("Could not find merge base with any of: " + tried);
}

auto Repository::numstat(std::string_view from, std::string_view to) const -> std::string {
  std::vector<std::string> args{"diff", "--numstat", std::string(from)};
  if (!to.empty())
    args.emplace_back(to);
  args.emplace_back("--");
  return git(args);
}

auto Repository::blob_lines(const std::string &path) const -> std::optional<std::int64_t> {
  auto argv = base_command(root_);
  argv.insert(argv.end(), {"cat-file", "blob", std::string(consts::kHead) + ":" + path});
  const auto res = process::run(argv, root_);
  if (!res.ok())
    return std::nullopt; // not present at HEAD
  return count_lines(res.out);
}

auto Repository::worktree_lines(const std::string &path) const
    -> std::optional<std::int64_t> {
  const auto full = root_ / path;
  if (!fs::is_regular_file(full))
    return std::nullopt;
  return count_lines(fs::read_file(full), LineEnding::Universal);
}

auto Repository::commit_info(std::string_view ref) const -> CommitInfo {
  const std::string raw = git({"log", "-1", "--no-show-signature", "--date=format:%z",
                               "--format=%H%x1f%ct%x1f%cd%x1f%B", std::string(ref), "--"});
  const auto fields = strutil::split(raw, kUnitSep);
  if (fields.size() < 4)
    throw Error("unexpected git log output for " + std::string(ref));

  const std::string hash = strutil::trim(fields[0]);
  const std::string epoch_text = strutil::trim(fields[1]);
  long long epoch = 0;
  const auto [ptr, ec] =
      std::from_chars(epoch_text.data(), epoch_text.data() + epoch_text.size(), epoch);
  if (ec != std::errc{} || ptr != epoch_text.data() + epoch_text.size())
    throw Error("unexpected commit timestamp for " + std::string(ref) + ": " + epoch_text);
  const int tz = timeutil::parse_tz_offset(strutil::trim(fields[2])).value_or(0);

  CommitInfo info;
  info.short_hash = hash.substr(0, consts::kShortHashLen);
  info.date = timeutil::format_timestamp(static_cast<std::time_t>(epoch), tz);
  info.message = first_line(fields[3]);
  return info;
}

} // namespace changeview
