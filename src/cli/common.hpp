#pragma once
#include "treefleet/fleet.hpp"

#include <exception>
#include <memory>

namespace treefleet::cli {

// Exit codes shared by every command.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitDirty = 2;
inline constexpr int kExitTimeout = 3;

std::unique_ptr<Fleet> open_fleet();

// Print "<cmd>: <what>" (plus the change list for a dirty refusal) and map to an exit code.
int fail(const char* cmd, const std::exception& e);

} // namespace treefleet::cli
