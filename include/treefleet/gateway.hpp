#pragma once
#include "treefleet/config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace treefleet {

struct WorktreeEntry {
  std::filesystem::path path;
  std::string branch;
  std::string head_sha;
};

struct StatusReport {
  bool clean = true;
  std::vector<std::string> changes; // "X  path" lines, empty when clean
};

/**
 * Everything the fleet needs from a primary repository. Each primitive is synchronous and
 * atomic from the caller's point of view and reports failure by throwing GatewayError.
 * Implementations: NativeGateway (on-disk repository), MemoryGateway (deterministic fake),
 * TimedGateway (deadline decorator).
 */
class RepositoryGateway {
public:
  virtual ~RepositoryGateway() = default;

  virtual void open(const std::filesystem::path& root) = 0;
  // Agent worktrees only; the primary checkout is never listed.
  virtual std::vector<WorktreeEntry> list_worktrees() = 0;
  virtual void create_worktree(const std::filesystem::path& path, const std::string& branch,
                               const std::string& base_ref) = 0;
  virtual void remove_worktree(const std::filesystem::path& path) = 0;
  virtual StatusReport status(const std::filesystem::path& path) = 0;
  // Stage everything and commit; returns the new head, or the old one if nothing changed.
  virtual std::string commit(const std::filesystem::path& path, const std::string& message,
                             const Identity& author) = 0;
  virtual std::string head_sha(const std::filesystem::path& path) = 0;
};

} // namespace treefleet
