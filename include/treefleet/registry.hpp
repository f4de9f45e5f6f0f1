#pragma once
#include "treefleet/record.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace treefleet {

/**
 * Durable record of which agent owns which worktree.
 *
 * One file per agent under `dir`, replaced atomically on every change, and written before
 * the gateway side effect it announces. The structural lock serializes spawn/nuke/reconcile
 * across processes; the internal mutex only keeps the in-memory map coherent for the
 * unlocked readers (status, sync).
 *
 * Corruption (unparseable file, agent/file-name mismatch, two claims on one path or branch)
 * is detected on load and never repaired here. Corruption found elsewhere (a worktree on the
 * wrong branch) is recorded with mark_corrupt under `dir/.corrupt/` and read back on every
 * load until an operator deletes the mark.
 */
class WorktreeRegistry {
public:
  explicit WorktreeRegistry(std::filesystem::path dir);

  // Replace the in-memory view with what is on disk.
  void load();
  // Re-read a single agent's file.
  std::optional<WorktreeRecord> reload(const std::string& agent_id);

  [[nodiscard]] std::optional<WorktreeRecord> find(const std::string& agent_id) const;
  [[nodiscard]] std::vector<WorktreeRecord> records() const;

  // Live claim on `path` / `branch` by an agent other than `except`.
  [[nodiscard]] std::optional<WorktreeRecord> claim_on_path(const std::filesystem::path& path,
                                                            const std::string& except) const;
  [[nodiscard]] std::optional<WorktreeRecord> claim_on_branch(const std::string& branch,
                                                              const std::string& except) const;

  // Throws FleetError(PathCollision/BranchCollision) if another record claims the same
  // path or branch, std::logic_error if the agent already has a claiming record.
  void insert(WorktreeRecord rec);

  // Forward transition (see can_transition), optionally recording a new head.
  // Throws FleetError(OrphanDetected) from Orphaned, std::logic_error on illegal moves.
  WorktreeRecord transition(const std::string& agent_id, WorktreeState to,
                            std::optional<std::string> head = std::nullopt);

  // Transition only if the record is currently in `from`; nullopt otherwise. Used by the
  // unlocked readers so they never overwrite a structural transition.
  std::optional<WorktreeRecord> transition_if(const std::string& agent_id, WorktreeState from,
                                              WorktreeState to,
                                              std::optional<std::string> head = std::nullopt);

  // Move a record out of Orphaned. Reserved for the reconciler.
  WorktreeRecord resolve_orphan(const std::string& agent_id, WorktreeState to,
                                std::optional<std::string> head = std::nullopt);

  void purge(const std::string& agent_id);

  void mark_corrupt(const std::string& agent_id, const std::string& reason);

  [[nodiscard]] bool is_corrupt(const std::string& agent_id) const;
  [[nodiscard]] std::optional<std::string> corruption(const std::string& agent_id) const;
  [[nodiscard]] std::map<std::string, std::string> corrupt_agents() const;

  [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
  std::filesystem::path file_for(const std::string& agent_id) const;
  std::filesystem::path mark_for(const std::string& agent_id) const;
  void write(const WorktreeRecord& rec) const;
  WorktreeRecord update(const std::string& agent_id, WorktreeState to,
                        std::optional<std::string> head, bool from_orphan);
  // Persist and store a new state for `slot`. Caller holds mu_.
  WorktreeRecord commit_state(WorktreeRecord& slot, WorktreeState to,
                              std::optional<std::string> head);
  void detect_conflicts();

  std::filesystem::path dir_;
  mutable std::mutex mu_;
  std::map<std::string, WorktreeRecord> records_;
  std::map<std::string, std::string> corrupt_; // agent -> reason
};

} // namespace treefleet
