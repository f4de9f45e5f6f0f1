#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace treefleet {

class Repository;

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted };

struct Change {
  ChangeKind kind;
  std::string path;  // repo-relative
};

struct Status {
  std::vector<Change> staged;          // HEAD vs index
  std::vector<Change> unstaged;        // working vs index
  std::vector<std::string> untracked;  // working - index

  [[nodiscard]] bool clean() const { return staged.empty() && unstaged.empty() && untracked.empty(); }
};

// Status of the checkout `repo` was opened on (primary or linked).
auto compute_status(const Repository& repo) -> Status;

// One "X  path" line per change: A/M/D for staged and unstaged, '?' for untracked.
auto summarize(const Status& st) -> std::vector<std::string>;

} // namespace treefleet
