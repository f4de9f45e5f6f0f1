#include "treefleet/timed_gateway.hpp"

#include "treefleet/errors.hpp"

#include <future>
#include <thread>

namespace treefleet {

TimedGateway::TimedGateway(std::shared_ptr<RepositoryGateway> inner,
                           std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {}

// `fn` takes the inner gateway by reference and must capture its arguments by value: an
// abandoned call keeps running after this frame is gone.
template <class Fn>
std::invoke_result_t<Fn &, RepositoryGateway &> TimedGateway::bounded(const char *primitive,
                                                                       Fn fn) {
  using Result = std::invoke_result_t<Fn &, RepositoryGateway &>;
  if (timeout_.count() <= 0)
    return fn(*inner_);

  auto task = std::make_shared<std::packaged_task<Result()>>(
      [inner = inner_, fn = std::move(fn)]() mutable { return fn(*inner); });
  auto result = task->get_future();
  std::thread([task] { (*task)(); }).detach();

  if (result.wait_for(timeout_) != std::future_status::ready)
    throw GatewayError(GatewayError::Class::Timeout, primitive,
                       "no answer after " + std::to_string(timeout_.count()) + " ms");
  return result.get();
}

void TimedGateway::open(const std::filesystem::path &root) {
  bounded("open", [root](RepositoryGateway &g) { g.open(root); });
}

std::vector<WorktreeEntry> TimedGateway::list_worktrees() {
  return bounded("list_worktrees", [](RepositoryGateway &g) { return g.list_worktrees(); });
}

void TimedGateway::create_worktree(const std::filesystem::path &path, const std::string &branch,
                                   const std::string &base_ref) {
  bounded("create_worktree", [path, branch, base_ref](RepositoryGateway &g) {
    g.create_worktree(path, branch, base_ref);
  });
}

void TimedGateway::remove_worktree(const std::filesystem::path &path) {
  bounded("remove_worktree", [path](RepositoryGateway &g) { g.remove_worktree(path); });
}

StatusReport TimedGateway::status(const std::filesystem::path &path) {
  return bounded("status", [path](RepositoryGateway &g) { return g.status(path); });
}

std::string TimedGateway::commit(const std::filesystem::path &path, const std::string &message,
                                 const Identity &author) {
  return bounded("commit", [path, message, author](RepositoryGateway &g) {
    return g.commit(path, message, author);
  });
}

std::string TimedGateway::head_sha(const std::filesystem::path &path) {
  return bounded("head_sha", [path](RepositoryGateway &g) { return g.head_sha(path); });
}

} // namespace treefleet
