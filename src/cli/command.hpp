#pragma once

namespace treefleet::cli {

// argv[0] is the subcommand name
using command_fn = int (*)(int argc, char** argv);

} // namespace treefleet::cli
