#include "treefleet/inspector.hpp"

#include "treefleet/errors.hpp"

namespace treefleet {

WorktreeRecord require_live(WorktreeRegistry &registry, const std::string &agent_id,
                            const std::string &operation) {
  if (!valid_agent_id(agent_id))
    throw FleetError(ErrorKind::InvalidAgentId, operation, agent_id, "not a usable agent id");

  // Pick up what other processes wrote since the last load.
  const auto rec = registry.reload(agent_id);
  if (auto reason = registry.corruption(agent_id))
    throw FleetError(ErrorKind::RegistryCorruption, operation, agent_id, *reason);
  if (!rec || rec->state == WorktreeState::Removed)
    throw FleetError(ErrorKind::UnknownAgent, operation, agent_id, "no worktree for this agent");

  switch (rec->state) {
  case WorktreeState::Orphaned:
    throw FleetError(ErrorKind::OrphanDetected, operation, agent_id,
                     "record is Orphaned; run reconcile");
  case WorktreeState::Spawning:
  case WorktreeState::Removing:
    throw FleetError(ErrorKind::OperationPending, operation, agent_id,
                     "record is " + std::string(to_string(rec->state)));
  default:
    return *rec;
  }
}

StatusInspector::StatusInspector(RepositoryGateway &gateway, WorktreeRegistry &registry)
    : gateway_(gateway), registry_(registry) {}

WorktreeStatus StatusInspector::status(const std::string &agent_id) {
  return inspect(require_live(registry_, agent_id, "status"), "status");
}

WorktreeStatus StatusInspector::inspect(const WorktreeRecord &rec, const std::string &operation) {
  StatusReport report;
  try {
    report = gateway_.status(rec.path);
  } catch (const GatewayError &e) {
    throw FleetError::from_gateway(e, operation, rec.agent_id);
  }

  if (report.clean)
    registry_.transition_if(rec.agent_id, WorktreeState::Dirty, WorktreeState::Active);
  else
    registry_.transition_if(rec.agent_id, WorktreeState::Active, WorktreeState::Dirty);

  return WorktreeStatus{.agent_id = rec.agent_id,
                        .clean = report.clean,
                        .changes = std::move(report.changes),
                        .head_sha = rec.head_sha};
}

} // namespace treefleet
