#include "treefleet/reconciler.hpp"

#include "treefleet/errors.hpp"

#include <set>

namespace treefleet {

namespace {

std::string describe(const WorktreeRecord &rec) {
  return rec.agent_id + " (" + std::string(to_string(rec.state)) + ")";
}

} // namespace

CleanupReconciler::CleanupReconciler(const FleetConfig &cfg, RepositoryGateway &gateway,
                                     WorktreeRegistry &registry, StructuralLock &lock)
    : cfg_(cfg), gateway_(gateway), registry_(registry), lock_(lock) {}

std::optional<std::string> CleanupReconciler::owner_of(const std::string &branch) const {
  if (!branch.starts_with(cfg_.branch_prefix))
    return std::nullopt;
  auto id = branch.substr(cfg_.branch_prefix.size());
  if (!valid_agent_id(id))
    return std::nullopt;
  return id;
}

ReconcileReport CleanupReconciler::reconcile() {
  auto guard = lock_.acquire();
  registry_.load();

  std::vector<WorktreeEntry> entries;
  try {
    entries = gateway_.list_worktrees();
  } catch (const GatewayError &e) {
    throw FleetError::from_gateway(e, "reconcile", "");
  }

  ReconcileReport report;
  report.corrupt = registry_.corrupt_agents();
  const auto now = std::chrono::system_clock::now();

  std::map<std::filesystem::path, const WorktreeEntry *> by_path;
  for (const auto &entry : entries)
    by_path[entry.path] = &entry;

  std::set<std::filesystem::path> claimed;
  for (const auto &rec : registry_.records()) {
    if (report.corrupt.contains(rec.agent_id)) {
      claimed.insert(rec.path);
      continue;
    }
    const auto it = by_path.find(rec.path);
    const WorktreeEntry *entry = it == by_path.end() ? nullptr : it->second;
    if (entry)
      claimed.insert(rec.path);
    settle_record(rec, entry, now, report);
  }

  for (const auto &entry : entries) {
    if (claimed.contains(entry.path) || held_by_corrupt(entry, report))
      continue;
    take_in(entry, now, report);
  }
  return report;
}

bool CleanupReconciler::held_by_corrupt(const WorktreeEntry &entry,
                                        const ReconcileReport &report) const {
  // A record that failed to parse gives no path or branch, so match on the naming scheme.
  if (const auto owner = owner_of(entry.branch); owner && report.corrupt.contains(*owner))
    return true;
  return entry.path.parent_path() == cfg_.worktree_root &&
         report.corrupt.contains(entry.path.filename().string());
}

void CleanupReconciler::settle_record(const WorktreeRecord &rec, const WorktreeEntry *entry,
                                      Timestamp now, ReconcileReport &report) {
  const bool stale = now - rec.last_transition_at >= cfg_.stale_after;
  const bool in_progress = rec.state == WorktreeState::Spawning ||
                           rec.state == WorktreeState::Removing ||
                           rec.state == WorktreeState::Committing;

  // A timed-out create or remove may still land; until the record is stale the missing
  // worktree is not evidence of anything.
  if (!entry && in_progress && !stale) {
    report.pending.push_back(describe(rec));
    return;
  }
  if (rec.state == WorktreeState::Removed || !entry) {
    registry_.purge(rec.agent_id);
    report.purged.push_back(describe(rec));
    return;
  }

  if (entry->branch != rec.branch) {
    const auto reason = "record says branch " + rec.branch + ", worktree is on " + entry->branch;
    registry_.mark_corrupt(rec.agent_id, reason);
    report.corrupt.emplace(rec.agent_id, reason);
    report.flagged.push_back(rec.agent_id);
    return;
  }

  switch (rec.state) {
  case WorktreeState::Orphaned:
    apply_policy(rec, *entry, report);
    return;
  case WorktreeState::Spawning:
  case WorktreeState::Removing:
  case WorktreeState::Committing:
    if (stale)
      retry_stale(rec, report);
    else
      report.pending.push_back(describe(rec));
    return;
  case WorktreeState::Active:
  case WorktreeState::Dirty:
  case WorktreeState::Removed:
    return;
  }
}

void CleanupReconciler::retry_stale(const WorktreeRecord &rec, ReconcileReport &report) {
  try {
    switch (rec.state) {
    case WorktreeState::Spawning:
      // The worktree exists, so the create went through.
      registry_.transition(rec.agent_id, WorktreeState::Active, gateway_.head_sha(rec.path));
      break;
    case WorktreeState::Removing:
      gateway_.remove_worktree(rec.path);
      registry_.transition(rec.agent_id, WorktreeState::Removed);
      registry_.purge(rec.agent_id);
      break;
    case WorktreeState::Committing: {
      const auto st = gateway_.status(rec.path);
      registry_.transition(rec.agent_id, st.clean ? WorktreeState::Active : WorktreeState::Dirty,
                           gateway_.head_sha(rec.path));
      break;
    }
    default:
      return;
    }
    report.completed.push_back(describe(rec));
  } catch (const GatewayError &e) {
    registry_.transition(rec.agent_id, WorktreeState::Orphaned);
    report.escalated.push_back(describe(rec));
    report.failures.push_back(rec.agent_id + ": " + e.what());
  }
}

void CleanupReconciler::apply_policy(const WorktreeRecord &rec, const WorktreeEntry &entry,
                                     ReconcileReport &report) {
  switch (cfg_.orphan_policy) {
  case OrphanPolicy::Report:
    report.outstanding.push_back(rec.agent_id);
    return;
  case OrphanPolicy::Adopt:
    registry_.resolve_orphan(rec.agent_id, WorktreeState::Active, entry.head_sha);
    report.adopted.push_back(rec.agent_id);
    return;
  case OrphanPolicy::Remove:
    registry_.resolve_orphan(rec.agent_id, WorktreeState::Removing);
    try {
      gateway_.remove_worktree(rec.path);
    } catch (const GatewayError &e) {
      registry_.transition(rec.agent_id, WorktreeState::Orphaned);
      report.outstanding.push_back(rec.agent_id);
      report.failures.push_back(rec.agent_id + ": " + e.what());
      return;
    }
    registry_.transition(rec.agent_id, WorktreeState::Removed);
    registry_.purge(rec.agent_id);
    report.removed.push_back(rec.agent_id);
    return;
  }
}

void CleanupReconciler::take_in(const WorktreeEntry &entry, Timestamp now,
                                ReconcileReport &report) {
  const auto owner = owner_of(entry.branch);
  const bool attributable = owner && !registry_.is_corrupt(*owner) && !registry_.find(*owner) &&
                            !registry_.claim_on_branch(entry.branch, *owner) &&
                            !registry_.claim_on_path(entry.path, *owner);
  if (!attributable) {
    if (cfg_.orphan_policy != OrphanPolicy::Remove) {
      report.foreign.push_back(entry.path.string());
      return;
    }
    try {
      gateway_.remove_worktree(entry.path);
      report.removed.push_back(entry.path.string());
    } catch (const GatewayError &e) {
      report.foreign.push_back(entry.path.string());
      report.failures.push_back(entry.path.string() + ": " + e.what());
    }
    return;
  }

  const WorktreeRecord rec{.agent_id = *owner,
                           .path = entry.path,
                           .branch = entry.branch,
                           .base_ref = entry.branch,
                           .state = WorktreeState::Orphaned,
                           .created_at = now,
                           .last_transition_at = now,
                           .head_sha = entry.head_sha};
  registry_.insert(rec);
  report.orphaned.push_back(rec.agent_id);
  if (cfg_.orphan_policy == OrphanPolicy::Report)
    return;
  apply_policy(rec, entry, report);
}

} // namespace treefleet
