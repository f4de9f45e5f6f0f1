#pragma once
#include "treefleet/gateway.hpp"
#include "treefleet/record.hpp"
#include "treefleet/registry.hpp"

#include <string>
#include <vector>

namespace treefleet {

struct WorktreeStatus {
  std::string agent_id;
  bool clean = true;
  std::vector<std::string> changes; // "X  path" lines
  std::string head_sha;             // as recorded

  [[nodiscard]] bool dirty() const { return !clean; }
};

// Read-only view of one agent's worktree. Takes no structural lock; the only registry writes
// are Active <-> Dirty refreshes, made with a compare-and-set so a concurrent nuke wins.
class StatusInspector {
public:
  StatusInspector(RepositoryGateway& gateway, WorktreeRegistry& registry);

  // Throws FleetError: UnknownAgent, OperationPending, OrphanDetected, RegistryCorruption or
  // the gateway failure.
  WorktreeStatus status(const std::string& agent_id);
  WorktreeStatus status(const WorktreeHandle& handle) { return status(handle.agent_id); }

  // Gateway status for `rec` plus the Active/Dirty refresh, without state checks.
  // Used by nuke as its dirty gate.
  WorktreeStatus inspect(const WorktreeRecord& rec, const std::string& operation);

private:
  RepositoryGateway& gateway_;
  WorktreeRegistry& registry_;
};

// Record for `agent_id` that status/sync may act on. Shared by the unlocked readers.
WorktreeRecord require_live(WorktreeRegistry& registry, const std::string& agent_id,
                            const std::string& operation);

} // namespace treefleet
