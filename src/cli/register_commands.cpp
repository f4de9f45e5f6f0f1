#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_spawn(int argc, char **argv);
int cmd_nuke(int argc, char **argv);
int cmd_status(int, char **);
int cmd_sync(int, char **);
int cmd_reconcile(int, char **);
int cmd_list(int, char **);

namespace treefleet::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "[--author \"Name <email>\"]",
                   "Create a repository here and commit its contents");
  register_command("spawn", ::cmd_spawn, "<agent> [--base <ref>]",
                   "Create (or return) an agent worktree");
  register_command("nuke", ::cmd_nuke, "<agent> [--force]", "Remove an agent worktree");
  register_command("status", ::cmd_status, "<agent>", "Clean/dirty state of a worktree");
  register_command("sync", ::cmd_sync, "<agent> <message> [--author \"Name <email>\"]",
                   "Commit everything in a worktree");
  register_command("reconcile", ::cmd_reconcile, "",
                   "Repair registry/worktree divergence after crashes");
  register_command("list", ::cmd_list, "", "Show every registered worktree");
}

} // namespace treefleet::cli
