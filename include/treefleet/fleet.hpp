#pragma once
#include "treefleet/committer.hpp"
#include "treefleet/config.hpp"
#include "treefleet/gateway.hpp"
#include "treefleet/inspector.hpp"
#include "treefleet/lifecycle.hpp"
#include "treefleet/reconciler.hpp"
#include "treefleet/registry.hpp"
#include "treefleet/structural_lock.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace treefleet {

// Everything that manages the agent worktrees of one primary repository: its config, gateway,
// registry, structural lock and the four components built on them.
class Fleet {
public:
  // Discover the primary from any path inside it or inside one of its worktrees, load its
  // config and wire a NativeGateway (behind a TimedGateway unless the timeout is 0).
  static std::unique_ptr<Fleet> open(const std::filesystem::path& start);

  // Create a primary repository at `root` with default config and commit its current
  // contents on `main`. Returns the initial commit.
  static std::string init(const std::filesystem::path& root,
                          const std::optional<Identity>& identity = std::nullopt);

  // Registry under `state_dir`/agents, lock file `state_dir`/fleet.lock.
  Fleet(FleetConfig cfg, std::shared_ptr<RepositoryGateway> gateway,
        const std::filesystem::path& state_dir);
  Fleet(const Fleet&) = delete;
  Fleet& operator=(const Fleet&) = delete;

  WorktreeHandle spawn(const std::string& agent_id,
                       const std::string& base_ref = std::string(consts::kDefaultBranch)) {
    return lifecycle_.spawn(agent_id, base_ref);
  }
  NukeOutcome nuke(const std::string& agent_id, bool force = false) {
    return lifecycle_.nuke(agent_id, force);
  }
  WorktreeStatus status(const std::string& agent_id) { return inspector_.status(agent_id); }
  std::string sync(const std::string& agent_id, const std::string& message,
                   const std::optional<Identity>& author = std::nullopt) {
    return committer_.sync(agent_id, message, author);
  }
  ReconcileReport reconcile() { return reconciler_.reconcile(); }

  // Snapshot of every record on disk, read under the structural lock.
  std::vector<WorktreeRecord> records();

  [[nodiscard]] const FleetConfig& config() const { return cfg_; }
  [[nodiscard]] WorktreeRegistry& registry() { return registry_; }
  [[nodiscard]] WorktreeLifecycleManager& lifecycle() { return lifecycle_; }

private:
  FleetConfig cfg_;
  std::shared_ptr<RepositoryGateway> gateway_;
  WorktreeRegistry registry_;
  StructuralLock lock_;
  StatusInspector inspector_;
  WorktreeLifecycleManager lifecycle_;
  CommitCoordinator committer_;
  CleanupReconciler reconciler_;
};

} // namespace treefleet
