#include "cli/registry.hpp"

#include "cli/common.hpp"

#include <algorithm>
#include <iomanip>
#include <map>

namespace treefleet::cli {

struct entry {
  command_fn fn;
  std::string synopsis;
  std::string summary;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &synopsis,
                      const std::string &summary) {
  table()[name] = entry{.fn = fn, .synopsis = synopsis, .summary = summary};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage(std::ostream &out) {
  std::size_t width = 0;
  for (const auto &[name, _] : table())
    width = std::max(width, name.size());

  out << "usage: treefleet <command> [args]\n"
      << "       treefleet help [command]\n\n"
      << "commands:\n";
  for (const auto &[name, e] : table())
    out << "  " << std::left << std::setw(static_cast<int>(width)) << name << "  " << e.summary
        << "\n";
  out << "\nexit status: " << kExitOk << " ok, " << kExitFailure << " failure, " << kExitDirty
      << " dirty worktree refused, " << kExitTimeout << " gateway timeout\n";
}

bool print_command_usage(std::ostream &out, const std::string &name) {
  const auto it = table().find(name);
  if (it == table().end())
    return false;
  out << "usage: treefleet " << name;
  if (!it->second.synopsis.empty())
    out << " " << it->second.synopsis;
  out << "\n  " << it->second.summary << "\n";
  return true;
}

} // namespace treefleet::cli
