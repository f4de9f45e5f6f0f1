#include "treefleet/lifecycle.hpp"

#include "treefleet/errors.hpp"

#include <chrono>

namespace treefleet {

namespace {

void check_id(const std::string &agent_id, const char *operation) {
  if (!valid_agent_id(agent_id))
    throw FleetError(ErrorKind::InvalidAgentId, operation, agent_id,
                     "agent ids are 1-64 characters of [A-Za-z0-9._-]");
}

void check_corruption(const WorktreeRegistry &registry, const std::string &agent_id,
                      const char *operation) {
  if (auto reason = registry.corruption(agent_id))
    throw FleetError(ErrorKind::RegistryCorruption, operation, agent_id, *reason);
}

} // namespace

WorktreeLifecycleManager::WorktreeLifecycleManager(const FleetConfig &cfg,
                                                   RepositoryGateway &gateway,
                                                   WorktreeRegistry &registry,
                                                   StructuralLock &lock,
                                                   StatusInspector &inspector)
    : cfg_(cfg), gateway_(gateway), registry_(registry), lock_(lock), inspector_(inspector) {}

std::filesystem::path WorktreeLifecycleManager::path_for(const std::string &agent_id) const {
  return cfg_.worktree_root / agent_id;
}

std::string WorktreeLifecycleManager::branch_for(const std::string &agent_id) const {
  return cfg_.branch_prefix + agent_id;
}

WorktreeHandle WorktreeLifecycleManager::spawn(const std::string &agent_id,
                                               const std::string &base_ref) {
  check_id(agent_id, "spawn");
  auto guard = lock_.acquire();
  registry_.load();
  check_corruption(registry_, agent_id, "spawn");

  if (auto rec = registry_.find(agent_id)) {
    switch (rec->state) {
    case WorktreeState::Active:
    case WorktreeState::Dirty:
    case WorktreeState::Committing:
      if (rec->base_ref != base_ref && cfg_.base_mismatch == BaseMismatchPolicy::Reject)
        throw FleetError(ErrorKind::BaseRefMismatch, "spawn", agent_id,
                         "worktree exists from '" + rec->base_ref + "', asked for '" + base_ref +
                             "'");
      return handle_of(*rec);
    case WorktreeState::Spawning:
    case WorktreeState::Removing:
      throw FleetError(ErrorKind::OperationPending, "spawn", agent_id,
                       "record is " + std::string(to_string(rec->state)) + "; run reconcile");
    case WorktreeState::Orphaned:
      throw FleetError(ErrorKind::OrphanDetected, "spawn", agent_id,
                       "record is Orphaned; run reconcile");
    case WorktreeState::Removed:
      registry_.purge(agent_id);
      break;
    }
  }

  const auto path = path_for(agent_id);
  const auto branch = branch_for(agent_id);

  if (auto other = registry_.claim_on_path(path, agent_id))
    throw FleetError(ErrorKind::PathCollision, "spawn", agent_id,
                     path.string() + " is held by " + other->agent_id);
  if (auto other = registry_.claim_on_branch(branch, agent_id))
    throw FleetError(ErrorKind::BranchCollision, "spawn", agent_id,
                     branch + " is held by " + other->agent_id);

  std::vector<WorktreeEntry> existing;
  try {
    existing = gateway_.list_worktrees();
  } catch (const GatewayError &e) {
    throw FleetError::from_gateway(e, "spawn", agent_id);
  }
  for (const auto &entry : existing) {
    if (entry.path == path)
      throw FleetError(ErrorKind::PathCollision, "spawn", agent_id,
                       "a worktree already exists at " + path.string());
    if (entry.branch == branch)
      throw FleetError(ErrorKind::BranchCollision, "spawn", agent_id,
                       branch + " is checked out at " + entry.path.string());
  }

  const auto now = std::chrono::system_clock::now();
  registry_.insert(WorktreeRecord{.agent_id = agent_id,
                                  .path = path,
                                  .branch = branch,
                                  .base_ref = base_ref,
                                  .state = WorktreeState::Spawning,
                                  .created_at = now,
                                  .last_transition_at = now,
                                  .head_sha = {}});

  std::string head;
  try {
    gateway_.create_worktree(path, branch, base_ref);
    head = gateway_.head_sha(path);
  } catch (const GatewayError &e) {
    if (e.timed_out())
      throw FleetError::from_gateway(e, "spawn", agent_id, "record left Spawning for reconcile");
    rollback_spawn(agent_id, path, e);
  }

  return handle_of(registry_.transition(agent_id, WorktreeState::Active, head));
}

void WorktreeLifecycleManager::rollback_spawn(const std::string &agent_id,
                                              const std::filesystem::path &path,
                                              const GatewayError &cause) {
  std::string note = "rolled back";
  try {
    gateway_.remove_worktree(path);
  } catch (const GatewayError &cleanup) {
    note += "; cleanup failed (" + std::string(cleanup.what()) + "), reconcile will report it";
  }
  registry_.purge(agent_id);
  throw FleetError::from_gateway(cause, "spawn", agent_id, note);
}

NukeOutcome WorktreeLifecycleManager::nuke(const std::string &agent_id, bool force) {
  check_id(agent_id, "nuke");
  auto guard = lock_.acquire();
  registry_.load();
  check_corruption(registry_, agent_id, "nuke");

  auto rec = registry_.find(agent_id);
  if (!rec)
    return NukeOutcome::AlreadyGone;

  switch (rec->state) {
  case WorktreeState::Removed:
    registry_.purge(agent_id);
    return NukeOutcome::AlreadyGone;
  case WorktreeState::Orphaned:
    throw FleetError(ErrorKind::OrphanDetected, "nuke", agent_id,
                     "record is Orphaned; run reconcile");
  case WorktreeState::Spawning:
    throw FleetError(ErrorKind::OperationPending, "nuke", agent_id,
                     "record is Spawning; run reconcile");
  case WorktreeState::Removing:
    // An earlier removal failed or was interrupted; intent is already recorded.
    break;
  case WorktreeState::Active:
  case WorktreeState::Dirty:
  case WorktreeState::Committing:
    if (!force) {
      auto st = inspector_.inspect(*rec, "nuke");
      if (st.dirty()) {
        const auto n = st.changes.size();
        throw FleetError(ErrorKind::DirtyWorktreeRefusal, "nuke", agent_id,
                         std::to_string(n) + " uncommitted change" + (n == 1 ? "" : "s") +
                             "; use force to discard",
                         std::move(st.changes));
      }
    }
    registry_.transition(agent_id, WorktreeState::Removing);
    break;
  }

  try {
    gateway_.remove_worktree(rec->path);
  } catch (const GatewayError &e) {
    throw FleetError::from_gateway(e, "nuke", agent_id, "record left Removing for reconcile");
  }

  registry_.transition(agent_id, WorktreeState::Removed);
  registry_.purge(agent_id);
  return NukeOutcome::Removed;
}

} // namespace treefleet
