#include "cli/app.hpp"

#include "changeview/collect.hpp"
#include "changeview/consts.hpp"
#include "changeview/errors.hpp"
#include "changeview/report.hpp"
#include "changeview/repo.hpp"
#include "changeview/util.hpp"

#include <exception>
#include <optional>

namespace changeview::cli {

namespace {

int execute(const Invocation &inv, const std::filesystem::path &cwd, std::ostream &out,
            bool stdout_is_tty) {
  const Repository repo = Repository::discover(cwd);
  if (!repo.has_commits())
    throw EmptyRepository("repository has no commits");

  Options opts = inv.opts;
  const FileConfig file = load_config(repo.root());
  apply_config(opts, file, inv.given);

  auto changes = collect_changes(repo, opts.mode, opts.base_branch);
  if (changes.empty()) {
    out << "No changes found.\n";
    return 0;
  }

  sort_changes(changes, opts.sort);
  const bool color = use_color(opts, file, stdout_is_tty);

  if (opts.json) {
    const auto base = base_ref(repo, opts.mode, opts.base_branch);
    out << report::to_json(changes, opts.mode, base).dump(2) << "\n";
    return 0;
  }

  // Footer is informational; drop it if any commit cannot be described.
  std::optional<ComparisonInfo> comparison;
  try {
    comparison = comparison_info(repo, opts.mode, opts.base_branch);
  } catch (const std::exception &) {
    comparison.reset();
  }

  for (const auto &line : report::text_lines(changes, opts.flat, color, comparison))
    out << line << "\n";
  return 0;
}

} // namespace

int run(const std::vector<std::string> &args, const std::filesystem::path &cwd,
        std::ostream &out, std::ostream &err, bool stdout_is_tty) {
  Invocation inv;
  try {
    inv = parse_args(args);
  } catch (const UsageError &e) {
    err << "changeview: " << e.what() << "\n\n";
    print_usage(err);
    return 2;
  }
  if (inv.help) {
    print_usage(out);
    return 0;
  }
  if (inv.version) {
    out << "changeview " << consts::kVersion << "\n";
    return 0;
  }

  try {
    return execute(inv, cwd, out, stdout_is_tty);
  } catch (const RepositoryNotFound &) {
    err << "Error: Not a git repository\n";
    err << "Run this command from within a git repository.\n";
  } catch (const EmptyRepository &) {
    err << "Error: Repository has no commits yet.\n";
  } catch (const MergeBaseNotFound &) {
    err << "Error: Could not find merge base with main branch.\n";
    err << "Tip: Make sure 'main' or 'master' branch exists, or use --uncommitted.\n";
  } catch (const InsufficientHistory &) {
    err << "Error: Not enough commits for --since-last comparison.\n";
    err << "Tip: Repository needs at least 2 commits.\n";
  } catch (const GitCommandError &e) {
    const std::string detail = strutil::trim(e.stderr_text());
    err << "Git error: " << (detail.empty() ? std::string(e.what()) : detail) << "\n";
  } catch (const std::exception &e) {
    err << "Error: " << e.what() << "\n";
  }
  return 1;
}

} // namespace changeview::cli
