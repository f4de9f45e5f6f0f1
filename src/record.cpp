#include "treefleet/record.hpp"

#include "treefleet/util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <sstream>
#include <stdexcept>

namespace treefleet {

namespace {

constexpr std::size_t kMaxAgentIdLen = 64;

long long to_millis(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp from_millis(std::string_view key, const std::string &text) {
  long long ms = 0;
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, ms);
  if (ec != std::errc{} || ptr != end)
    throw std::runtime_error("record: bad timestamp for " + std::string(key));
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms))};
}

} // namespace

std::string_view to_string(WorktreeState state) {
  switch (state) {
  case WorktreeState::Spawning:
    return "Spawning";
  case WorktreeState::Active:
    return "Active";
  case WorktreeState::Dirty:
    return "Dirty";
  case WorktreeState::Committing:
    return "Committing";
  case WorktreeState::Removing:
    return "Removing";
  case WorktreeState::Removed:
    return "Removed";
  case WorktreeState::Orphaned:
    return "Orphaned";
  }
  return "Unknown";
}

std::optional<WorktreeState> parse_state(std::string_view text) {
  for (const auto s : {WorktreeState::Spawning, WorktreeState::Active, WorktreeState::Dirty,
                       WorktreeState::Committing, WorktreeState::Removing, WorktreeState::Removed,
                       WorktreeState::Orphaned}) {
    if (to_string(s) == text)
      return s;
  }
  return std::nullopt;
}

bool can_transition(WorktreeState from, WorktreeState to) {
  using S = WorktreeState;
  if (from == to)
    return from != S::Removed;
  if (to == S::Orphaned)
    return from != S::Removed;
  switch (from) {
  case S::Spawning:
    return to == S::Active || to == S::Removed;
  case S::Active:
    return to == S::Dirty || to == S::Committing || to == S::Removing;
  case S::Dirty:
    // a worktree whose edits were reverted reads clean again
    return to == S::Active || to == S::Committing || to == S::Removing;
  case S::Committing:
    return to == S::Active || to == S::Dirty || to == S::Removing;
  case S::Removing:
    return to == S::Removed;
  case S::Removed:
  case S::Orphaned:
    return false;
  }
  return false;
}

WorktreeHandle handle_of(const WorktreeRecord &rec) {
  return WorktreeHandle{
      .agent_id = rec.agent_id, .path = rec.path, .branch = rec.branch, .head_sha = rec.head_sha};
}

bool valid_agent_id(std::string_view id) {
  if (id.empty() || id.size() > kMaxAgentIdLen)
    return false;
  if (id.front() == '.' || id.front() == '-')
    return false;
  if (id.find("..") != std::string_view::npos)
    return false;
  return std::ranges::all_of(id, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
  });
}

std::string serialize_record(const WorktreeRecord &rec) {
  std::ostringstream os;
  os << "agent: " << rec.agent_id << '\n'
     << "path: " << rec.path.string() << '\n'
     << "branch: " << rec.branch << '\n'
     << "base: " << rec.base_ref << '\n'
     << "state: " << to_string(rec.state) << '\n'
     << "created_at: " << to_millis(rec.created_at) << '\n'
     << "last_transition_at: " << to_millis(rec.last_transition_at) << '\n'
     << "head: " << rec.head_sha << '\n';
  return os.str();
}

WorktreeRecord parse_record(std::string_view text) {
  std::map<std::string, std::string> fields;
  std::istringstream in{std::string(text)};
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#')
      continue;
    const auto colon = line.find(':');
    if (colon == std::string::npos)
      throw std::runtime_error("record: malformed line '" + line + "'");
    fields[strutil::trim(std::string_view(line).substr(0, colon))] =
        strutil::trim(std::string_view(line).substr(colon + 1));
  }

  auto need = [&](const char *key) -> const std::string & {
    const auto it = fields.find(key);
    if (it == fields.end())
      throw std::runtime_error(std::string("record: missing field '") + key + "'");
    return it->second;
  };

  WorktreeRecord rec;
  rec.agent_id = need("agent");
  rec.path = need("path");
  rec.branch = need("branch");
  rec.base_ref = need("base");
  const auto state = parse_state(need("state"));
  if (!state)
    throw std::runtime_error("record: unknown state '" + need("state") + "'");
  rec.state = *state;
  rec.created_at = from_millis("created_at", need("created_at"));
  rec.last_transition_at = from_millis("last_transition_at", need("last_transition_at"));
  rec.head_sha = need("head");

  if (rec.agent_id.empty() || rec.path.empty() || rec.branch.empty())
    throw std::runtime_error("record: empty agent, path or branch");
  return rec;
}

} // namespace treefleet
