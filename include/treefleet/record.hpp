#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace treefleet {

enum class WorktreeState : std::uint8_t {
  Spawning,
  Active,
  Dirty,
  Committing,
  Removing,
  Removed,
  Orphaned,
};

std::string_view to_string(WorktreeState state);
std::optional<WorktreeState> parse_state(std::string_view text);

// Forward moves only. Orphaned is reachable from every state but Removed; leaving Orphaned
// is not a transition (see WorktreeRegistry::resolve_orphan). Same-state updates are allowed.
bool can_transition(WorktreeState from, WorktreeState to);

using Timestamp = std::chrono::system_clock::time_point;

struct WorktreeRecord {
  std::string agent_id;
  std::filesystem::path path;
  std::string branch;
  std::string base_ref;
  WorktreeState state = WorktreeState::Spawning;
  Timestamp created_at{};
  Timestamp last_transition_at{};
  std::string head_sha;

  // Owns its path and branch: everything except Removed.
  [[nodiscard]] bool holds_claim() const { return state != WorktreeState::Removed; }
  // Usable by status/sync.
  [[nodiscard]] bool live() const {
    return state == WorktreeState::Active || state == WorktreeState::Dirty ||
           state == WorktreeState::Committing;
  }
  [[nodiscard]] bool in_progress() const {
    return state == WorktreeState::Spawning || state == WorktreeState::Removing ||
           state == WorktreeState::Committing;
  }
};

// What a caller holds on to after spawn.
struct WorktreeHandle {
  std::string agent_id;
  std::filesystem::path path;
  std::string branch;
  std::string head_sha;

  bool operator==(const WorktreeHandle&) const = default;
};

WorktreeHandle handle_of(const WorktreeRecord& rec);

// Usable as a file name and a branch component: [A-Za-z0-9._-], 1..64 chars, no leading '.'
// or '-', no "..".
bool valid_agent_id(std::string_view id);

// "key: value" lines; parse throws std::runtime_error on missing or malformed fields.
std::string serialize_record(const WorktreeRecord& rec);
WorktreeRecord parse_record(std::string_view text);

} // namespace treefleet
