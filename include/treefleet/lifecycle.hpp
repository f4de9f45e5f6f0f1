#pragma once
#include "treefleet/config.hpp"
#include "treefleet/consts.hpp"
#include "treefleet/errors.hpp"
#include "treefleet/gateway.hpp"
#include "treefleet/inspector.hpp"
#include "treefleet/record.hpp"
#include "treefleet/registry.hpp"
#include "treefleet/structural_lock.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace treefleet {

enum class NukeOutcome : std::uint8_t { Removed, AlreadyGone };

/**
 * Creates and destroys agent worktrees.
 *
 * Both operations hold the structural lock for their whole duration, reload the registry from
 * disk, and record intent (Spawning / Removing) before calling the gateway, so a crash at any
 * point leaves a record the reconciler can finish or undo.
 */
class WorktreeLifecycleManager {
public:
  WorktreeLifecycleManager(const FleetConfig& cfg, RepositoryGateway& gateway,
                           WorktreeRegistry& registry, StructuralLock& lock,
                           StatusInspector& inspector);

  // Idempotent for an agent that already has a live worktree (subject to base_mismatch).
  // A timed-out create leaves the record Spawning; any other failure rolls back.
  WorktreeHandle spawn(const std::string& agent_id,
                       const std::string& base_ref = std::string(consts::kDefaultBranch));

  // Refuses a dirty worktree unless `force`. A failed removal leaves the record Removing;
  // calling nuke again retries it.
  NukeOutcome nuke(const std::string& agent_id, bool force = false);

  [[nodiscard]] std::filesystem::path path_for(const std::string& agent_id) const;
  [[nodiscard]] std::string branch_for(const std::string& agent_id) const;

private:
  [[noreturn]] void rollback_spawn(const std::string& agent_id, const std::filesystem::path& path,
                      const GatewayError& cause);

  const FleetConfig& cfg_;
  RepositoryGateway& gateway_;
  WorktreeRegistry& registry_;
  StructuralLock& lock_;
  StatusInspector& inspector_;
};

} // namespace treefleet
