#include "treefleet/memory_gateway.hpp"

#include "treefleet/hash.hpp"

#include <thread>

namespace treefleet {

namespace {

GatewayError fatal(const char *primitive, const std::string &message) {
  return GatewayError(GatewayError::Class::Fatal, primitive, message);
}

} // namespace

MemoryGateway::MemoryGateway() { branches_["main"] = next_sha("root"); }

std::string MemoryGateway::next_sha(const std::string &seed) {
  return to_hex(sha1(seed + "#" + std::to_string(++counter_)));
}

void MemoryGateway::enter(Primitive p, const char *name) {
  std::chrono::milliseconds wait{0};
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++calls_[p];
    if (auto it = delays_.find(p); it != delays_.end())
      wait = it->second;
  }
  if (wait.count() > 0)
    std::this_thread::sleep_for(wait);

  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = failures_.find(p); it != failures_.end()) {
    const auto cls = it->second;
    failures_.erase(it);
    throw GatewayError(cls, name, "injected failure");
  }
}

void MemoryGateway::open(const std::filesystem::path & /*root*/) {
  std::lock_guard<std::mutex> lk(mu_);
  open_ = true;
}

std::vector<WorktreeEntry> MemoryGateway::list_worktrees() {
  enter(Primitive::List, "list_worktrees");
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<WorktreeEntry> out;
  for (const auto &[path, wt] : worktrees_)
    out.push_back(WorktreeEntry{.path = path, .branch = wt.branch, .head_sha = branches_[wt.branch]});
  return out;
}

void MemoryGateway::create_worktree(const std::filesystem::path &path, const std::string &branch,
                                    const std::string &base_ref) {
  enter(Primitive::Create, "create_worktree");
  std::lock_guard<std::mutex> lk(mu_);
  if (worktrees_.contains(path))
    throw fatal("create_worktree", "destination is not empty: " + path.string());
  for (const auto &[other, wt] : worktrees_) {
    if (wt.branch == branch)
      throw fatal("create_worktree", "branch '" + branch + "' is checked out at " + other.string());
  }
  if (!branches_.contains(branch)) {
    const auto base = branches_.find(base_ref);
    if (base == branches_.end())
      throw fatal("create_worktree", "invalid base ref '" + base_ref + "'");
    branches_[branch] = base->second;
  }
  worktrees_[path] = Worktree{.branch = branch, .pending = {}};
}

void MemoryGateway::remove_worktree(const std::filesystem::path &path) {
  enter(Primitive::Remove, "remove_worktree");
  std::lock_guard<std::mutex> lk(mu_);
  worktrees_.erase(path);
}

StatusReport MemoryGateway::status(const std::filesystem::path &path) {
  enter(Primitive::Status, "status");
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = worktrees_.find(path);
  if (it == worktrees_.end())
    throw fatal("status", "no worktree at " + path.string());
  StatusReport report;
  report.clean = it->second.pending.empty();
  for (const auto &file : it->second.pending)
    report.changes.push_back("?  " + file);
  return report;
}

std::string MemoryGateway::commit(const std::filesystem::path &path, const std::string &message,
                                  const Identity &author) {
  enter(Primitive::Commit, "commit");
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = worktrees_.find(path);
  if (it == worktrees_.end())
    throw fatal("commit", "no worktree at " + path.string());
  auto &head = branches_[it->second.branch];
  if (it->second.pending.empty())
    return head;
  head = next_sha(head + message + author.email);
  it->second.pending.clear();
  return head;
}

std::string MemoryGateway::head_sha(const std::filesystem::path &path) {
  enter(Primitive::Head, "head_sha");
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = worktrees_.find(path);
  if (it == worktrees_.end())
    throw fatal("head_sha", "no worktree at " + path.string());
  return branches_[it->second.branch];
}

void MemoryGateway::fail_next(Primitive p, GatewayError::Class cls) {
  std::lock_guard<std::mutex> lk(mu_);
  failures_[p] = cls;
}

void MemoryGateway::delay(Primitive p, std::chrono::milliseconds d) {
  std::lock_guard<std::mutex> lk(mu_);
  delays_[p] = d;
}

void MemoryGateway::touch(const std::filesystem::path &worktree, const std::string &file) {
  std::lock_guard<std::mutex> lk(mu_);
  worktrees_.at(worktree).pending.insert(file);
}

void MemoryGateway::add_foreign(const std::filesystem::path &path, const std::string &branch) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!branches_.contains(branch))
    branches_[branch] = branches_["main"];
  worktrees_[path] = Worktree{.branch = branch, .pending = {}};
}

void MemoryGateway::vanish(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lk(mu_);
  worktrees_.erase(path);
}

bool MemoryGateway::has_worktree(const std::filesystem::path &path) const {
  std::lock_guard<std::mutex> lk(mu_);
  return worktrees_.contains(path);
}

std::optional<std::string> MemoryGateway::branch_head(const std::string &branch) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = branches_.find(branch);
  if (it == branches_.end())
    return std::nullopt;
  return it->second;
}

int MemoryGateway::calls(Primitive p) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = calls_.find(p);
  return it == calls_.end() ? 0 : it->second;
}

} // namespace treefleet
