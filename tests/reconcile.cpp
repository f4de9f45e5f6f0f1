#include "treefleet/errors.hpp"
#include "treefleet/fleet.hpp"
#include "treefleet/fs.hpp"
#include "treefleet/memory_gateway.hpp"
#include "treefleet/timed_gateway.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <fstream>
#include <random>
#include <thread>

namespace fs = std::filesystem;
using treefleet::ErrorKind;
using treefleet::MemoryGateway;
using treefleet::OrphanPolicy;
using treefleet::WorktreeState;
using Op = treefleet::MemoryGateway::Primitive;
using Class = treefleet::GatewayError::Class;

static treefleet::FleetConfig config_with(OrphanPolicy policy) {
  treefleet::FleetConfig cfg;
  cfg.worktree_root = "/fleet/wt";
  cfg.gateway_timeout = std::chrono::milliseconds(0);
  cfg.stale_after = std::chrono::seconds(0);
  cfg.orphan_policy = policy;
  return cfg;
}

// Write a record as a crashed process would have left it.
static void plant(const fs::path &agents, const std::string &agent, WorktreeState state) {
  const auto now = std::chrono::system_clock::now();
  const treefleet::WorktreeRecord rec{.agent_id = agent,
                                      .path = "/fleet/wt/" + agent,
                                      .branch = "fleet/" + agent,
                                      .base_ref = "main",
                                      .state = state,
                                      .created_at = now,
                                      .last_transition_at = now,
                                      .head_sha = {}};
  treefleet::fs::write_text_atomic(agents / agent, treefleet::serialize_record(rec));
}

template <class Fn> static std::optional<ErrorKind> kind_of(Fn &&fn) {
  try {
    fn();
  } catch (const treefleet::FleetError &e) {
    return e.kind();
  }
  return std::nullopt;
}

static bool has(const std::vector<std::string> &xs, const std::string &needle) {
  return std::ranges::any_of(xs, [&](const auto &x) { return x.starts_with(needle); });
}

int main() {
  const fs::path state = fs::temp_directory_path() /
                         ("treefleet_reconcile_" + std::to_string(std::random_device{}()));

  try {
    // 1) crash during spawn with nothing created: the record is purged
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Report), gw, state / "spawn"};
      plant(state / "spawn" / "agents", "ghost", WorktreeState::Spawning);
      const auto report = fleet.reconcile();
      if (!has(report.purged, "ghost") || !fleet.records().empty()) {
        std::cerr << "stale Spawning record without worktree should be purged\n";
        return 1;
      }
      if (fleet.reconcile().changed()) {
        std::cerr << "second pass should be a no-op\n";
        return 1;
      }
    }

    // 2) crash during spawn after the worktree was created: the spawn is completed
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Report), gw, state / "finish"};
      gw->create_worktree("/fleet/wt/half", "fleet/half", "main");
      plant(state / "finish" / "agents", "half", WorktreeState::Spawning);
      const auto report = fleet.reconcile();
      const auto rec = fleet.registry().find("half");
      if (!has(report.completed, "half") || !rec || rec->state != WorktreeState::Active ||
          rec->head_sha != gw->branch_head("main") || report.stale() != 1) {
        std::cerr << "stale Spawning with worktree should become Active\n";
        return 1;
      }
    }

    // 3) stale Removing: the removal is retried once, then escalated
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Report), gw, state / "removing"};
      gw->create_worktree("/fleet/wt/r1", "fleet/r1", "main");
      gw->create_worktree("/fleet/wt/r2", "fleet/r2", "main");
      plant(state / "removing" / "agents", "r1", WorktreeState::Removing);
      auto report = fleet.reconcile();
      if (!has(report.completed, "r1") || gw->has_worktree("/fleet/wt/r1") ||
          fleet.registry().find("r1")) {
        std::cerr << "stale Removing should be retried to completion\n";
        return 1;
      }

      plant(state / "removing" / "agents", "r2", WorktreeState::Removing);
      gw->fail_next(Op::Remove, Class::Fatal);
      report = fleet.reconcile();
      if (!has(report.escalated, "r2") || report.failures.empty() ||
          fleet.registry().find("r2")->state != WorktreeState::Orphaned) {
        std::cerr << "failed retry should escalate to Orphaned\n";
        return 1;
      }
      report = fleet.reconcile();
      if (report.changed() || report.outstanding != std::vector<std::string>{"r2"}) {
        std::cerr << "escalated record should stay put under report policy\n";
        return 1;
      }
    }

    // 4) worktrees without a record, under each policy
    for (const auto policy : {OrphanPolicy::Report, OrphanPolicy::Adopt, OrphanPolicy::Remove}) {
      auto gw = std::make_shared<MemoryGateway>();
      const auto dir = state / ("policy-" + std::string(treefleet::to_string(policy)));
      treefleet::Fleet fleet{config_with(policy), gw, dir};
      gw->add_foreign("/fleet/wt/lost", "fleet/lost");
      gw->add_foreign("/somewhere/else", "feature/x");

      const auto first = fleet.reconcile();
      if (first.orphaned != std::vector<std::string>{"lost"}) {
        std::cerr << to_string(policy) << ": lost worktree should be marked Orphaned\n";
        return 1;
      }
      const auto rec = fleet.registry().find("lost");
      switch (policy) {
      case OrphanPolicy::Report:
        if (!rec || rec->state != WorktreeState::Orphaned || !gw->has_worktree("/fleet/wt/lost") ||
            first.foreign != std::vector<std::string>{"/somewhere/else"}) {
          std::cerr << "report: orphan should be recorded and left alone\n";
          return 1;
        }
        try {
          fleet.spawn("lost");
          std::cerr << "spawn over an Orphaned record succeeded\n";
          return 1;
        } catch (const treefleet::FleetError &e) {
          if (e.kind() != treefleet::ErrorKind::OrphanDetected) {
            std::cerr << "expected OrphanDetected, got " << e.what() << "\n";
            return 1;
          }
        }
        break;
      case OrphanPolicy::Adopt:
        if (!rec || rec->state != WorktreeState::Active || first.adopted.size() != 1 ||
            first.foreign.size() != 1) {
          std::cerr << "adopt: orphan should become Active\n";
          return 1;
        }
        if (fleet.spawn("lost").path != "/fleet/wt/lost") {
          std::cerr << "adopted worktree should be handed out by spawn\n";
          return 1;
        }
        break;
      case OrphanPolicy::Remove:
        if (rec || gw->has_worktree("/fleet/wt/lost") || gw->has_worktree("/somewhere/else") ||
            first.removed.size() != 2) {
          std::cerr << "remove: orphan and foreign worktree should be gone\n";
          return 1;
        }
        break;
      }

      const auto second = fleet.reconcile();
      if (second.changed() || !second.orphaned.empty()) {
        std::cerr << to_string(policy) << ": second pass should be a no-op\n";
        return 1;
      }
    }

    // 5) a record whose worktree vanished is purged, fresh in-progress records are left alone
    {
      auto gw = std::make_shared<MemoryGateway>();
      auto cfg = config_with(OrphanPolicy::Report);
      cfg.stale_after = std::chrono::seconds(3600);
      treefleet::Fleet fleet{cfg, gw, state / "vanish"};
      const auto h = fleet.spawn("v");
      gw->vanish(h.path);
      gw->create_worktree("/fleet/wt/busy", "fleet/busy", "main");
      plant(state / "vanish" / "agents", "busy", WorktreeState::Committing);

      const auto report = fleet.reconcile();
      if (!has(report.purged, "v") || !has(report.pending, "busy") ||
          fleet.registry().find("busy")->state != WorktreeState::Committing) {
        std::cerr << "vanished record purged, fresh Committing left\n";
        return 1;
      }
    }

    // 6) a list failure aborts the pass without touching anything
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Remove), gw, state / "listfail"};
      plant(state / "listfail" / "agents", "keep", WorktreeState::Spawning);
      gw->fail_next(Op::List, Class::Transient);
      bool threw = false;
      try {
        (void)fleet.reconcile();
      } catch (const treefleet::FleetError &e) {
        threw = e.kind() == treefleet::ErrorKind::GatewayFailure && e.transient();
      }
      if (!threw || !fleet.registry().find("keep")) {
        std::cerr << "list failure should abort reconcile\n";
        return 1;
      }
    }

    // 7) stale Committing: the outcome is read back from the worktree
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Report), gw, state / "committing"};
      gw->create_worktree("/fleet/wt/c1", "fleet/c1", "main");
      gw->create_worktree("/fleet/wt/c2", "fleet/c2", "main");
      gw->create_worktree("/fleet/wt/c3", "fleet/c3", "main");
      gw->touch("/fleet/wt/c2", "half-done.txt");
      for (const auto *agent : {"c1", "c2", "c3"})
        plant(state / "committing" / "agents", agent, WorktreeState::Committing);
      gw->fail_next(Op::Status, Class::Fatal);

      const auto report = fleet.reconcile();
      const auto c1 = fleet.registry().find("c1");
      const auto c2 = fleet.registry().find("c2");
      const auto c3 = fleet.registry().find("c3");
      // records are visited in agent order, so the injected failure hits c1
      if (!has(report.escalated, "c1") || c1->state != WorktreeState::Orphaned) {
        std::cerr << "failed Committing retry should escalate\n";
        return 1;
      }
      if (!has(report.completed, "c2") || c2->state != WorktreeState::Dirty ||
          c2->head_sha != gw->branch_head("fleet/c2")) {
        std::cerr << "Committing with pending changes should settle as Dirty\n";
        return 1;
      }
      if (!has(report.completed, "c3") || c3->state != WorktreeState::Active ||
          c3->head_sha != gw->branch_head("fleet/c3")) {
        std::cerr << "clean Committing should settle as Active\n";
        return 1;
      }
    }

    // 8) a spawn that timed out is left alone until it is stale, even before its create lands
    {
      auto mem = std::make_shared<MemoryGateway>();
      auto timed = std::make_shared<treefleet::TimedGateway>(mem, std::chrono::milliseconds(30));
      auto cfg = config_with(OrphanPolicy::Remove);
      cfg.gateway_timeout = timed->timeout();
      cfg.stale_after = std::chrono::seconds(3600);
      treefleet::Fleet fleet{cfg, timed, state / "late"};

      mem->delay(Op::Create, std::chrono::milliseconds(300));
      if (kind_of([&] { fleet.spawn("a"); }) != ErrorKind::Timeout) {
        std::cerr << "slow create should time out\n";
        return 1;
      }
      mem->delay(Op::Create, std::chrono::milliseconds(0));
      auto report = fleet.reconcile();
      if (!has(report.pending, "a") || report.changed() ||
          fleet.registry().find("a")->state != WorktreeState::Spawning) {
        std::cerr << "fresh Spawning record without worktree must stay pending\n";
        return 1;
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(500));
      report = fleet.reconcile();
      if (!mem->has_worktree("/fleet/wt/a") || !has(report.pending, "a") || report.changed()) {
        std::cerr << "late create must not be treated as an orphan\n";
        return 1;
      }

      cfg.stale_after = std::chrono::seconds(0);
      treefleet::Fleet later{cfg, timed, state / "late"};
      report = later.reconcile();
      if (!has(report.completed, "a") || later.registry().find("a")->state != WorktreeState::Active) {
        std::cerr << "stale Spawning with worktree should complete\n";
        return 1;
      }
    }

    // 9) a corrupt record keeps its worktree, even under the remove policy
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Remove), gw, state / "corrupt"};
      const auto h = fleet.spawn("keep");
      gw->touch(h.path, "work-in-progress.txt");
      std::ofstream(state / "corrupt" / "agents" / "keep") << "garbage\n";

      auto report = fleet.reconcile();
      if (!report.corrupt.contains("keep") || !report.removed.empty() ||
          !report.foreign.empty() || !report.orphaned.empty() || !gw->has_worktree(h.path)) {
        std::cerr << "corrupt agent's worktree must not be touched\n";
        return 1;
      }
      if (kind_of([&] { fleet.nuke("keep", true); }) != ErrorKind::RegistryCorruption ||
          !gw->has_worktree(h.path)) {
        std::cerr << "nuke of a corrupt agent should refuse\n";
        return 1;
      }
      report = fleet.reconcile();
      if (report.changed() || !gw->has_worktree(h.path)) {
        std::cerr << "second pass over corruption should be a no-op\n";
        return 1;
      }
    }

    // 10) a worktree on the wrong branch marks its agent corrupt for good
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{config_with(OrphanPolicy::Remove), gw, state / "mismatch"};
      gw->add_foreign("/fleet/wt/mix", "feature/y");
      plant(state / "mismatch" / "agents", "mix", WorktreeState::Active);

      auto report = fleet.reconcile();
      if (!report.corrupt.contains("mix") || report.flagged != std::vector<std::string>{"mix"} ||
          !gw->has_worktree("/fleet/wt/mix")) {
        std::cerr << "branch mismatch should be flagged corrupt\n";
        return 1;
      }
      if (!fleet.reconcile().corrupt.contains("mix") || fleet.reconcile().changed()) {
        std::cerr << "flagged agent should stay corrupt without further changes\n";
        return 1;
      }

      treefleet::Fleet reopened{config_with(OrphanPolicy::Remove), gw, state / "mismatch"};
      if (kind_of([&] { reopened.nuke("mix", true); }) != ErrorKind::RegistryCorruption ||
          kind_of([&] { reopened.spawn("mix"); }) != ErrorKind::RegistryCorruption ||
          kind_of([&] { (void)reopened.status("mix"); }) != ErrorKind::RegistryCorruption ||
          !gw->has_worktree("/fleet/wt/mix")) {
        std::cerr << "structural operations on a flagged agent should refuse\n";
        return 1;
      }
    }

    std::cout << "reconcile OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(state);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(state, ec);
  return 0;
}
