#include "treefleet/committer.hpp"

#include "treefleet/errors.hpp"
#include "treefleet/inspector.hpp"

namespace treefleet {

CommitCoordinator::CommitCoordinator(const FleetConfig &cfg, RepositoryGateway &gateway,
                                     WorktreeRegistry &registry)
    : cfg_(cfg), gateway_(gateway), registry_(registry) {}

std::string CommitCoordinator::sync(const std::string &agent_id, const std::string &message,
                                    const std::optional<Identity> &author) {
  const auto rec = require_live(registry_, agent_id, "sync");
  if (rec.state == WorktreeState::Committing)
    throw FleetError(ErrorKind::OperationPending, "sync", agent_id,
                     "an earlier commit did not finish; run reconcile");

  StatusReport st;
  try {
    st = gateway_.status(rec.path);
  } catch (const GatewayError &e) {
    throw FleetError::from_gateway(e, "sync", agent_id);
  }
  if (st.clean) {
    registry_.transition_if(agent_id, WorktreeState::Dirty, WorktreeState::Active);
    return rec.head_sha;
  }

  registry_.transition_if(agent_id, WorktreeState::Active, WorktreeState::Dirty);
  if (!registry_.transition_if(agent_id, WorktreeState::Dirty, WorktreeState::Committing))
    throw FleetError(ErrorKind::OperationPending, "sync", agent_id,
                     "record changed state during sync");

  std::string head;
  try {
    head = gateway_.commit(rec.path, message, author.value_or(cfg_.identity));
  } catch (const GatewayError &e) {
    if (e.timed_out())
      throw FleetError::from_gateway(e, "sync", agent_id, "record left Committing for reconcile");
    registry_.transition(agent_id, WorktreeState::Dirty);
    throw FleetError::from_gateway(e, "sync", agent_id);
  }

  registry_.transition(agent_id, WorktreeState::Active, head);
  return head;
}

} // namespace treefleet
