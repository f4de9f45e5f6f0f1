#pragma once
#include "treefleet/config.hpp"
#include "treefleet/gateway.hpp"
#include "treefleet/record.hpp"
#include "treefleet/registry.hpp"

#include <optional>
#include <string>

namespace treefleet {

// Commits everything pending in one agent's worktree. Runs without the structural lock;
// callers serialize syncs of the same agent themselves.
class CommitCoordinator {
public:
  CommitCoordinator(const FleetConfig& cfg, RepositoryGateway& gateway, WorktreeRegistry& registry);

  // Returns the new head, or the recorded head when nothing changed. Moves the record
  // Dirty -> Committing -> Active; a gateway failure puts it back to Dirty, a timeout leaves it
  // Committing for the reconciler. `author` defaults to the configured identity.
  std::string sync(const std::string& agent_id, const std::string& message,
                   const std::optional<Identity>& author = std::nullopt);
  std::string sync(const WorktreeHandle& handle, const std::string& message,
                   const std::optional<Identity>& author = std::nullopt) {
    return sync(handle.agent_id, message, author);
  }

private:
  const FleetConfig& cfg_;
  RepositoryGateway& gateway_;
  WorktreeRegistry& registry_;
};

} // namespace treefleet
