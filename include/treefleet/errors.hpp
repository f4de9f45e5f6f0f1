#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace treefleet {

enum class ErrorKind : std::uint8_t {
  PathCollision,
  BranchCollision,
  DirtyWorktreeRefusal,
  GatewayFailure,
  Timeout,
  OrphanDetected,
  RegistryCorruption,
  InvalidAgentId,
  UnknownAgent,
  OperationPending,
  BaseRefMismatch,
};

std::string_view to_string(ErrorKind kind);

// Failure of one repository primitive. Transient failures (ref lock contention, busy
// filesystem) may succeed on retry; fatal ones will not; Timeout means the outcome is unknown.
class GatewayError : public std::runtime_error {
public:
  enum class Class : std::uint8_t { Transient, Fatal, Timeout };

  GatewayError(Class cls, std::string primitive, const std::string& message);

  [[nodiscard]] Class cls() const noexcept { return cls_; }
  [[nodiscard]] bool transient() const noexcept { return cls_ == Class::Transient; }
  [[nodiscard]] bool timed_out() const noexcept { return cls_ == Class::Timeout; }
  [[nodiscard]] const std::string& primitive() const noexcept { return primitive_; }

private:
  Class cls_;
  std::string primitive_;
};

// Failure of a fleet operation. what() reads "<operation> <agent>: <Kind>: <detail>".
class FleetError : public std::runtime_error {
public:
  FleetError(ErrorKind kind, std::string operation, std::string agent_id, std::string detail,
             std::vector<std::string> changes = {});

  // Gateway failure during `operation`; Timeout-class errors map to ErrorKind::Timeout.
  // `note` is appended to the detail (e.g. what rollback did).
  static FleetError from_gateway(const GatewayError& e, std::string operation, std::string agent_id,
                                 const std::string& note = {});

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
  [[nodiscard]] const std::string& agent_id() const noexcept { return agent_id_; }
  [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
  [[nodiscard]] bool transient() const noexcept { return transient_; }
  // Uncommitted changes behind a DirtyWorktreeRefusal.
  [[nodiscard]] const std::vector<std::string>& changes() const noexcept { return changes_; }

private:
  ErrorKind kind_;
  std::string operation_;
  std::string agent_id_;
  std::string detail_;
  std::vector<std::string> changes_;
  bool transient_ = false;
};

} // namespace treefleet
