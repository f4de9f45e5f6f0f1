#include "treefleet/registry.hpp"

#include "treefleet/errors.hpp"
#include "treefleet/fs.hpp"
#include "treefleet/util.hpp"

#include <stdexcept>
#include <system_error>

namespace treefleet {

WorktreeRegistry::WorktreeRegistry(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path WorktreeRegistry::file_for(const std::string &agent_id) const {
  return dir_ / agent_id;
}

std::filesystem::path WorktreeRegistry::mark_for(const std::string &agent_id) const {
  return dir_ / ".corrupt" / agent_id;
}

void WorktreeRegistry::write(const WorktreeRecord &rec) const {
  fs::write_text_atomic(file_for(rec.agent_id), serialize_record(rec));
}

void WorktreeRegistry::load() {
  std::map<std::string, WorktreeRecord> loaded;
  std::map<std::string, std::string> corrupt;

  if (fs::exists(dir_)) {
    for (const auto &entry : std::filesystem::directory_iterator(dir_)) {
      if (!entry.is_regular_file() || entry.path().extension() == ".tmp")
        continue;
      const std::string name = entry.path().filename().string();
      try {
        auto rec = parse_record(fs::read_text(entry.path()));
        if (rec.agent_id != name) {
          corrupt[name] = "record names agent '" + rec.agent_id + "'";
          continue;
        }
        loaded.emplace(name, std::move(rec));
      } catch (const std::runtime_error &e) {
        corrupt[name] = e.what();
      }
    }
  }

  const auto marks = dir_ / ".corrupt";
  if (fs::exists(marks)) {
    for (const auto &entry : std::filesystem::directory_iterator(marks)) {
      if (!entry.is_regular_file() || entry.path().extension() == ".tmp")
        continue;
      corrupt[entry.path().filename().string()] = strutil::trim(fs::read_text(entry.path()));
    }
  }

  std::lock_guard<std::mutex> lk(mu_);
  records_ = std::move(loaded);
  corrupt_ = std::move(corrupt);
  detect_conflicts();
}

void WorktreeRegistry::detect_conflicts() {
  std::map<std::filesystem::path, std::vector<std::string>> by_path;
  std::map<std::string, std::vector<std::string>> by_branch;
  for (const auto &[id, rec] : records_) {
    if (!rec.holds_claim())
      continue;
    by_path[rec.path].push_back(id);
    by_branch[rec.branch].push_back(id);
  }
  for (const auto &[path, ids] : by_path) {
    if (ids.size() > 1) {
      for (const auto &id : ids)
        corrupt_[id] = "path " + path.string() + " claimed by " + std::to_string(ids.size()) +
                       " records";
    }
  }
  for (const auto &[branch, ids] : by_branch) {
    if (ids.size() > 1) {
      for (const auto &id : ids)
        corrupt_[id] = "branch " + branch + " claimed by " + std::to_string(ids.size()) +
                       " records";
    }
  }
}

std::optional<WorktreeRecord> WorktreeRegistry::reload(const std::string &agent_id) {
  const auto path = file_for(agent_id);
  std::optional<WorktreeRecord> rec;
  if (fs::exists(path)) {
    std::string reason;
    try {
      rec = parse_record(fs::read_text(path));
      if (rec->agent_id != agent_id)
        reason = "record names agent '" + rec->agent_id + "'";
    } catch (const std::runtime_error &e) {
      reason = e.what();
    }
    if (!reason.empty()) {
      std::lock_guard<std::mutex> lk(mu_);
      corrupt_[agent_id] = reason;
      records_.erase(agent_id);
      return std::nullopt;
    }
  }

  std::optional<std::string> mark;
  if (fs::exists(mark_for(agent_id)))
    mark = strutil::trim(fs::read_text(mark_for(agent_id)));

  std::lock_guard<std::mutex> lk(mu_);
  if (mark)
    corrupt_[agent_id] = *mark;
  if (rec)
    records_[agent_id] = *rec;
  else
    records_.erase(agent_id);
  return rec;
}

std::optional<WorktreeRecord> WorktreeRegistry::find(const std::string &agent_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = records_.find(agent_id);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

std::vector<WorktreeRecord> WorktreeRegistry::records() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<WorktreeRecord> out;
  out.reserve(records_.size());
  for (const auto &[_, rec] : records_)
    out.push_back(rec);
  return out;
}

std::optional<WorktreeRecord> WorktreeRegistry::claim_on_path(const std::filesystem::path &path,
                                                              const std::string &except) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto &[id, rec] : records_) {
    if (id != except && rec.holds_claim() && rec.path == path)
      return rec;
  }
  return std::nullopt;
}

std::optional<WorktreeRecord> WorktreeRegistry::claim_on_branch(const std::string &branch,
                                                                const std::string &except) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto &[id, rec] : records_) {
    if (id != except && rec.holds_claim() && rec.branch == branch)
      return rec;
  }
  return std::nullopt;
}

void WorktreeRegistry::insert(WorktreeRecord rec) {
  if (auto other = claim_on_path(rec.path, rec.agent_id))
    throw FleetError(ErrorKind::PathCollision, "register", rec.agent_id,
                     rec.path.string() + " is held by " + other->agent_id);
  if (auto other = claim_on_branch(rec.branch, rec.agent_id))
    throw FleetError(ErrorKind::BranchCollision, "register", rec.agent_id,
                     rec.branch + " is held by " + other->agent_id);
  if (auto existing = find(rec.agent_id); existing && existing->holds_claim())
    throw std::logic_error("registry: " + rec.agent_id + " already has a " +
                           std::string(to_string(existing->state)) + " record");

  write(rec);
  std::lock_guard<std::mutex> lk(mu_);
  records_[rec.agent_id] = std::move(rec);
}

WorktreeRecord WorktreeRegistry::update(const std::string &agent_id, WorktreeState to,
                                        std::optional<std::string> head, bool from_orphan) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = records_.find(agent_id);
  if (it == records_.end())
    throw std::logic_error("registry: no record for " + agent_id);
  const WorktreeState from = it->second.state;

  if (from_orphan) {
    if (from != WorktreeState::Orphaned)
      throw std::logic_error("registry: " + agent_id + " is not Orphaned");
    if (to != WorktreeState::Active && to != WorktreeState::Removing &&
        to != WorktreeState::Removed)
      throw std::logic_error("registry: cannot resolve orphan to " + std::string(to_string(to)));
  } else {
    if (from == WorktreeState::Orphaned && to != WorktreeState::Orphaned)
      throw FleetError(ErrorKind::OrphanDetected, "transition", agent_id,
                       "only reconciliation may move an Orphaned record");
    if (!can_transition(from, to))
      throw std::logic_error("registry: illegal transition " + std::string(to_string(from)) +
                             " -> " + std::string(to_string(to)) + " for " + agent_id);
  }
  return commit_state(it->second, to, std::move(head));
}

WorktreeRecord WorktreeRegistry::commit_state(WorktreeRecord &slot, WorktreeState to,
                                              std::optional<std::string> head) {
  WorktreeRecord rec = slot;
  rec.state = to;
  rec.last_transition_at = std::chrono::system_clock::now();
  if (head)
    rec.head_sha = std::move(*head);
  write(rec);
  slot = rec;
  return rec;
}

std::optional<WorktreeRecord> WorktreeRegistry::transition_if(const std::string &agent_id,
                                                              WorktreeState from, WorktreeState to,
                                                              std::optional<std::string> head) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = records_.find(agent_id);
  if (it == records_.end() || it->second.state != from)
    return std::nullopt;
  if (!can_transition(from, to))
    throw std::logic_error("registry: illegal transition " + std::string(to_string(from)) +
                           " -> " + std::string(to_string(to)) + " for " + agent_id);
  return commit_state(it->second, to, std::move(head));
}

WorktreeRecord WorktreeRegistry::transition(const std::string &agent_id, WorktreeState to,
                                            std::optional<std::string> head) {
  return update(agent_id, to, std::move(head), false);
}

WorktreeRecord WorktreeRegistry::resolve_orphan(const std::string &agent_id, WorktreeState to,
                                                std::optional<std::string> head) {
  return update(agent_id, to, std::move(head), true);
}

void WorktreeRegistry::purge(const std::string &agent_id) {
  std::error_code ec;
  std::filesystem::remove(file_for(agent_id), ec);
  if (ec)
    throw std::filesystem::filesystem_error("registry purge failed", file_for(agent_id), ec);
  std::lock_guard<std::mutex> lk(mu_);
  records_.erase(agent_id);
}

void WorktreeRegistry::mark_corrupt(const std::string &agent_id, const std::string &reason) {
  fs::write_text_atomic(mark_for(agent_id), reason + "\n");
  std::lock_guard<std::mutex> lk(mu_);
  corrupt_[agent_id] = reason;
}

bool WorktreeRegistry::is_corrupt(const std::string &agent_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return corrupt_.contains(agent_id);
}

std::optional<std::string> WorktreeRegistry::corruption(const std::string &agent_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = corrupt_.find(agent_id);
  if (it == corrupt_.end())
    return std::nullopt;
  return it->second;
}

std::map<std::string, std::string> WorktreeRegistry::corrupt_agents() const {
  std::lock_guard<std::mutex> lk(mu_);
  return corrupt_;
}

} // namespace treefleet
