#pragma once
#include "treefleet/gateway.hpp"

#include <chrono>
#include <memory>
#include <type_traits>

namespace treefleet {

// Bounds every primitive of `inner` by `timeout`. Each call runs on its own thread; if it has
// not finished in time the caller gets GatewayError(Timeout) and the call is left to finish
// (or not) in the background. The inner gateway is shared with those threads so it outlives
// an abandoned call. The record such a call belongs to stays in progress until stale_after has
// passed, which load_config keeps longer than the timeout.
class TimedGateway : public RepositoryGateway {
public:
  TimedGateway(std::shared_ptr<RepositoryGateway> inner, std::chrono::milliseconds timeout);

  void open(const std::filesystem::path& root) override;
  std::vector<WorktreeEntry> list_worktrees() override;
  void create_worktree(const std::filesystem::path& path, const std::string& branch,
                       const std::string& base_ref) override;
  void remove_worktree(const std::filesystem::path& path) override;
  StatusReport status(const std::filesystem::path& path) override;
  std::string commit(const std::filesystem::path& path, const std::string& message,
                     const Identity& author) override;
  std::string head_sha(const std::filesystem::path& path) override;

  [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
  template <class Fn>
  std::invoke_result_t<Fn&, RepositoryGateway&> bounded(const char* primitive, Fn fn);

  std::shared_ptr<RepositoryGateway> inner_;
  std::chrono::milliseconds timeout_;
};

} // namespace treefleet
