#pragma once
#include "treefleet/errors.hpp"
#include "treefleet/gateway.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace treefleet {

// In-process stand-in for a repository, for exercising the fleet without touching disk.
// Mirrors NativeGateway's rules (non-empty destination, branch checked out twice, unknown
// base ref are fatal; existing branches are resumed) and lets tests inject failures.
class MemoryGateway : public RepositoryGateway {
public:
  enum class Primitive : std::uint8_t { List, Create, Remove, Status, Commit, Head };

  // Starts with branch `main` at a root commit.
  MemoryGateway();

  void open(const std::filesystem::path& root) override;
  std::vector<WorktreeEntry> list_worktrees() override;
  void create_worktree(const std::filesystem::path& path, const std::string& branch,
                       const std::string& base_ref) override;
  void remove_worktree(const std::filesystem::path& path) override;
  StatusReport status(const std::filesystem::path& path) override;
  std::string commit(const std::filesystem::path& path, const std::string& message,
                     const Identity& author) override;
  std::string head_sha(const std::filesystem::path& path) override;

  // Failure injection: the next call to `p` throws GatewayError of class `cls`.
  void fail_next(Primitive p, GatewayError::Class cls);
  // Calls to `p` sleep `delay` before doing anything (0 to stop).
  void delay(Primitive p, std::chrono::milliseconds delay);

  // Simulated agent edits and external interference.
  void touch(const std::filesystem::path& worktree, const std::string& file);
  void add_foreign(const std::filesystem::path& path, const std::string& branch);
  void vanish(const std::filesystem::path& path);

  [[nodiscard]] bool has_worktree(const std::filesystem::path& path) const;
  [[nodiscard]] std::optional<std::string> branch_head(const std::string& branch) const;
  [[nodiscard]] int calls(Primitive p) const;

private:
  struct Worktree {
    std::string branch;
    std::set<std::string> pending;
  };

  // Counts the call, applies delay, throws an injected failure. Locks mu_ itself.
  void enter(Primitive p, const char* name);
  std::string next_sha(const std::string& seed);

  mutable std::mutex mu_;
  std::map<std::filesystem::path, Worktree> worktrees_;
  std::map<std::string, std::string> branches_; // branch -> head
  std::map<Primitive, GatewayError::Class> failures_;
  std::map<Primitive, std::chrono::milliseconds> delays_;
  std::map<Primitive, int> calls_;
  std::uint64_t counter_ = 0;
  bool open_ = false;
};

} // namespace treefleet
