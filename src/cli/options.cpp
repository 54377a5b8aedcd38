#include "cli/app.hpp"

#include "changeview/change.hpp"

#include <string_view>

namespace changeview::cli {

namespace {

// "--name=value" or "--name value"; advances `i` when the value is the next argument.
std::string option_value(const std::vector<std::string> &args, std::size_t &i,
                         std::string_view name) {
  const std::string &a = args[i];
  if (a.size() > name.size() && a[name.size()] == '=')
    return a.substr(name.size() + 1);
  if (i + 1 >= args.size())
    throw UsageError("option " + std::string(name) + " requires a value");
  return args[++i];
}

bool is_option(std::string_view arg, std::string_view name) {
  return arg == name || (arg.size() > name.size() && arg.rfind(name, 0) == 0 &&
                         arg[name.size()] == '=');
}

} // namespace

Invocation parse_args(const std::vector<std::string> &args) {
  Invocation inv;
  bool since_last = false;
  bool uncommitted = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (a == "--since-last") {
      since_last = true;
    } else if (a == "--uncommitted") {
      uncommitted = true;
    } else if (a == "--flat") {
      inv.opts.flat = true;
    } else if (a == "--json") {
      inv.opts.json = true;
    } else if (a == "--no-color") {
      inv.opts.no_color = true;
    } else if (is_option(a, "--sort")) {
      const std::string value = option_value(args, i, "--sort");
      const auto key = parse_sort_key(value);
      if (!key)
        throw UsageError("invalid value for --sort: '" + value +
                         "' (choose from name, changes, path)");
      inv.opts.sort = *key;
      inv.given.sort = true;
    } else if (is_option(a, "--base")) {
      inv.opts.base_branch = option_value(args, i, "--base");
      if (inv.opts.base_branch.empty())
        throw UsageError("option --base requires a branch name");
      inv.given.base = true;
    } else if (a == "-h" || a == "--help") {
      inv.help = true;
    } else if (a == "--version") {
      inv.version = true;
    } else {
      throw UsageError("no such option: " + a);
    }
  }

  // --since-last takes precedence over --uncommitted regardless of order
  if (since_last)
    inv.opts.mode = Mode::SinceLast;
  else if (uncommitted)
    inv.opts.mode = Mode::Uncommitted;
  return inv;
}

void print_usage(std::ostream &os) {
  os << "usage: changeview [options]\n\n";
  os << "Display changed files with line counts in tree view.\n";
  os << "By default, compares the current branch against main since divergence.\n\n";
  os << "options:\n";
  os << "  --since-last            Compare HEAD vs previous commit\n";
  os << "  --uncommitted           Show uncommitted changes (staged + unstaged)\n";
  os << "  --flat                  Flat list instead of tree view\n";
  os << "  --json                  Output as JSON\n";
  os << "  --sort name|changes|path\n";
  os << "                          Sort order (default: name)\n";
  os << "  --base <branch>         Branch to diverge from (default: main)\n";
  os << "  --no-color              Disable colored output\n";
  os << "  --version               Print version and exit\n";
  os << "  -h, --help              Show this message and exit\n";
}

} // namespace changeview::cli
