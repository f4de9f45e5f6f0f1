#include "treefleet/errors.hpp"

#include <utility>

namespace treefleet {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::PathCollision:
    return "PathCollision";
  case ErrorKind::BranchCollision:
    return "BranchCollision";
  case ErrorKind::DirtyWorktreeRefusal:
    return "DirtyWorktreeRefusal";
  case ErrorKind::GatewayFailure:
    return "GatewayFailure";
  case ErrorKind::Timeout:
    return "Timeout";
  case ErrorKind::OrphanDetected:
    return "OrphanDetected";
  case ErrorKind::RegistryCorruption:
    return "RegistryCorruption";
  case ErrorKind::InvalidAgentId:
    return "InvalidAgentId";
  case ErrorKind::UnknownAgent:
    return "UnknownAgent";
  case ErrorKind::OperationPending:
    return "OperationPending";
  case ErrorKind::BaseRefMismatch:
    return "BaseRefMismatch";
  }
  return "Unknown";
}

GatewayError::GatewayError(Class cls, std::string primitive, const std::string &message)
    : std::runtime_error(primitive + ": " + message), cls_(cls), primitive_(std::move(primitive)) {}

namespace {

std::string render(ErrorKind kind, const std::string &operation, const std::string &agent_id,
                   const std::string &detail) {
  std::string s = operation;
  if (!agent_id.empty())
    s += " " + agent_id;
  s += ": ";
  s += to_string(kind);
  if (!detail.empty())
    s += ": " + detail;
  return s;
}

} // namespace

FleetError::FleetError(ErrorKind kind, std::string operation, std::string agent_id,
                       std::string detail, std::vector<std::string> changes)
    : std::runtime_error(render(kind, operation, agent_id, detail)), kind_(kind),
      operation_(std::move(operation)), agent_id_(std::move(agent_id)), detail_(std::move(detail)),
      changes_(std::move(changes)) {}

FleetError FleetError::from_gateway(const GatewayError &e, std::string operation,
                                    std::string agent_id, const std::string &note) {
  std::string detail = e.what();
  if (!note.empty())
    detail += "; " + note;
  if (e.timed_out())
    return FleetError(ErrorKind::Timeout, std::move(operation), std::move(agent_id), detail);
  FleetError out(ErrorKind::GatewayFailure, std::move(operation), std::move(agent_id),
                 std::string(e.transient() ? "transient: " : "fatal: ") + detail);
  out.transient_ = e.transient();
  return out;
}

} // namespace treefleet
