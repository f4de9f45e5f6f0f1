#include "treefleet/fleet.hpp"

#include "treefleet/consts.hpp"
#include "treefleet/native_gateway.hpp"
#include "treefleet/repo.hpp"
#include "treefleet/timed_gateway.hpp"

#include <system_error>

namespace treefleet {

namespace {

std::filesystem::path prepare_state_dir(const std::filesystem::path &state_dir) {
  const auto agents = state_dir / consts::kAgentsDir;
  std::error_code ec;
  std::filesystem::create_directories(agents, ec);
  if (ec)
    throw std::filesystem::filesystem_error("cannot create registry directory", agents, ec);
  return agents;
}

} // namespace

Fleet::Fleet(FleetConfig cfg, std::shared_ptr<RepositoryGateway> gateway,
             const std::filesystem::path &state_dir)
    : cfg_(std::move(cfg)), gateway_(std::move(gateway)), registry_(prepare_state_dir(state_dir)),
      lock_(state_dir / consts::kFleetLockFile), inspector_(*gateway_, registry_),
      lifecycle_(cfg_, *gateway_, registry_, lock_, inspector_),
      committer_(cfg_, *gateway_, registry_), reconciler_(cfg_, *gateway_, registry_, lock_) {}

std::unique_ptr<Fleet> Fleet::open(const std::filesystem::path &start) {
  const auto repo = Repository::open(start);
  auto cfg = load_config(repo.common_dir());
  cfg.worktree_root = std::filesystem::weakly_canonical(cfg.worktree_root);

  std::shared_ptr<RepositoryGateway> gateway = std::make_shared<NativeGateway>();
  gateway->open(repo.primary_root());
  if (cfg.gateway_timeout.count() > 0)
    gateway = std::make_shared<TimedGateway>(std::move(gateway), cfg.gateway_timeout);

  return std::make_unique<Fleet>(std::move(cfg), std::move(gateway),
                                 repo.common_dir() / consts::kFleetDir);
}

std::string Fleet::init(const std::filesystem::path &root, const std::optional<Identity> &identity) {
  const auto repo = Repository::init(root);
  auto cfg = load_config(repo.common_dir());
  if (identity)
    cfg.identity = *identity;
  save_config(repo.common_dir(), cfg);
  return repo.commit_all("initial commit", cfg.identity);
}

std::vector<WorktreeRecord> Fleet::records() {
  auto guard = lock_.acquire();
  registry_.load();
  return registry_.records();
}

} // namespace treefleet
