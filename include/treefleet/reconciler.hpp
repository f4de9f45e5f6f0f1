#pragma once
#include "treefleet/config.hpp"
#include "treefleet/gateway.hpp"
#include "treefleet/record.hpp"
#include "treefleet/registry.hpp"
#include "treefleet/structural_lock.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace treefleet {

struct ReconcileReport {
  std::vector<std::string> purged;      // records with no worktree behind them
  std::vector<std::string> orphaned;    // worktrees found without a record, now Orphaned
  std::vector<std::string> adopted;     // Orphaned -> Active
  std::vector<std::string> removed;     // worktrees removed under the remove policy
  std::vector<std::string> foreign;     // worktree paths no agent can be derived for
  std::vector<std::string> completed;   // stale in-progress records finished on retry
  std::vector<std::string> escalated;   // stale records whose retry failed, now Orphaned
  std::vector<std::string> outstanding; // Orphaned records left for an operator
  std::vector<std::string> pending;     // in-progress records not yet stale
  std::map<std::string, std::string> corrupt; // agent -> reason
  std::vector<std::string> flagged;     // agents this pass marked corrupt
  std::vector<std::string> failures;    // gateway errors met during the pass

  [[nodiscard]] std::size_t orphans() const {
    return orphaned.size() + escalated.size() + outstanding.size();
  }
  [[nodiscard]] std::size_t stale() const { return completed.size() + escalated.size(); }
  // False when the pass left registry and gateway exactly as it found them.
  [[nodiscard]] bool changed() const {
    return !purged.empty() || !orphaned.empty() || !adopted.empty() || !removed.empty() ||
           !completed.empty() || !escalated.empty() || !flagged.empty();
  }
};

/**
 * Brings the registry back in line with the gateway's worktree list after crashes or outside
 * interference. The only code allowed to move a record out of Orphaned.
 *
 *  - a record whose worktree is gone is purged (the filesystem wins), unless it is an
 *    in-progress record that is not stale yet;
 *  - worktrees of corrupt agents are never touched, and a record whose worktree is on another
 *    branch is marked corrupt;
 *  - a worktree with no record gets an Orphaned record when its branch names a free agent,
 *    then the orphan policy applies; other worktrees are foreign;
 *  - a Spawning/Removing/Committing record older than stale_after has its operation retried
 *    once, and is marked Orphaned if that fails.
 *
 * Runs under the structural lock. A second pass with nothing changed in between is a no-op.
 */
class CleanupReconciler {
public:
  CleanupReconciler(const FleetConfig& cfg, RepositoryGateway& gateway, WorktreeRegistry& registry,
                    StructuralLock& lock);

  ReconcileReport reconcile();

private:
  void settle_record(const WorktreeRecord& rec, const WorktreeEntry* entry, Timestamp now,
                     ReconcileReport& report);
  void retry_stale(const WorktreeRecord& rec, ReconcileReport& report);
  void apply_policy(const WorktreeRecord& rec, const WorktreeEntry& entry, ReconcileReport& report);
  void take_in(const WorktreeEntry& entry, Timestamp now, ReconcileReport& report);
  [[nodiscard]] bool held_by_corrupt(const WorktreeEntry& entry,
                                     const ReconcileReport& report) const;
  // Agent that a worktree on `branch` belongs to, if the branch follows the naming scheme.
  [[nodiscard]] std::optional<std::string> owner_of(const std::string& branch) const;

  const FleetConfig& cfg_;
  RepositoryGateway& gateway_;
  WorktreeRegistry& registry_;
  StructuralLock& lock_;
};

} // namespace treefleet
