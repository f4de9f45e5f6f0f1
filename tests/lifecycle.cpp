#include "treefleet/errors.hpp"
#include "treefleet/fleet.hpp"
#include "treefleet/memory_gateway.hpp"
#include "treefleet/timed_gateway.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <thread>

namespace fs = std::filesystem;
using treefleet::ErrorKind;
using treefleet::MemoryGateway;
using treefleet::WorktreeState;
using Op = treefleet::MemoryGateway::Primitive;
using Class = treefleet::GatewayError::Class;

template <class Fn> static std::optional<ErrorKind> kind_of(Fn &&fn) {
  try {
    fn();
  } catch (const treefleet::FleetError &e) {
    return e.kind();
  }
  return std::nullopt;
}

static treefleet::FleetConfig test_config() {
  treefleet::FleetConfig cfg;
  cfg.worktree_root = "/fleet/wt";
  cfg.gateway_timeout = std::chrono::milliseconds(0);
  return cfg;
}

static std::optional<WorktreeState> state_of(treefleet::Fleet &fleet, const std::string &agent) {
  for (const auto &rec : fleet.records()) {
    if (rec.agent_id == agent)
      return rec.state;
  }
  return std::nullopt;
}

int main() {
  const fs::path state = fs::temp_directory_path() /
                         ("treefleet_lifecycle_" + std::to_string(std::random_device{}()));

  try {
    // 1) spawn, idempotent respawn, nuke
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{test_config(), gw, state / "one"};

      const auto h = fleet.spawn("agent-1", "main");
      if (h.path != "/fleet/wt/agent-1" || h.branch != "fleet/agent-1" ||
          h.head_sha != gw->branch_head("main") || !gw->has_worktree(h.path)) {
        std::cerr << "spawn handle mismatch\n";
        return 1;
      }
      if (state_of(fleet, "agent-1") != WorktreeState::Active) {
        std::cerr << "record should be Active\n";
        return 1;
      }
      if (fleet.spawn("agent-1", "main") != h || gw->calls(Op::Create) != 1) {
        std::cerr << "second spawn should return the same handle without creating\n";
        return 1;
      }

      // nuke refuses a dirty worktree and reports what is pending
      gw->touch(h.path, "notes.txt");
      try {
        fleet.nuke("agent-1");
        std::cerr << "dirty nuke succeeded\n";
        return 1;
      } catch (const treefleet::FleetError &e) {
        if (e.kind() != ErrorKind::DirtyWorktreeRefusal || e.changes().size() != 1 ||
            e.agent_id() != "agent-1" || e.operation() != "nuke") {
          std::cerr << "wrong refusal: " << e.what() << "\n";
          return 1;
        }
      }
      if (!gw->has_worktree(h.path) || state_of(fleet, "agent-1") != WorktreeState::Dirty) {
        std::cerr << "refused nuke must not remove anything\n";
        return 1;
      }
      if (fleet.nuke("agent-1", true) != treefleet::NukeOutcome::Removed ||
          gw->has_worktree(h.path) || state_of(fleet, "agent-1")) {
        std::cerr << "forced nuke should remove worktree and record\n";
        return 1;
      }
      if (fleet.nuke("agent-1") != treefleet::NukeOutcome::AlreadyGone) {
        std::cerr << "nuke of an absent agent should succeed\n";
        return 1;
      }
      if (kind_of([&] { fleet.spawn("../etc"); }) != ErrorKind::InvalidAgentId) {
        std::cerr << "bad agent id accepted\n";
        return 1;
      }
    }

    // 2) collisions with worktrees the registry does not own
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{test_config(), gw, state / "two"};
      gw->add_foreign("/fleet/wt/taken", "other");
      gw->add_foreign("/elsewhere/x", "fleet/busy");
      if (kind_of([&] { fleet.spawn("taken"); }) != ErrorKind::PathCollision ||
          kind_of([&] { fleet.spawn("busy"); }) != ErrorKind::BranchCollision) {
        std::cerr << "expected collisions\n";
        return 1;
      }
      if (!fleet.records().empty() || gw->calls(Op::Create) != 0) {
        std::cerr << "collision must not mutate\n";
        return 1;
      }
    }

    // 3) gateway failures during spawn roll back; a timeout leaves Spawning
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{test_config(), gw, state / "three"};

      gw->fail_next(Op::Create, Class::Fatal);
      if (kind_of([&] { fleet.spawn("a"); }) != ErrorKind::GatewayFailure ||
          !fleet.records().empty()) {
        std::cerr << "fatal create should roll back\n";
        return 1;
      }
      if (kind_of([&] { fleet.spawn("b", "no-such-ref"); }) != ErrorKind::GatewayFailure ||
          !fleet.records().empty() || gw->has_worktree("/fleet/wt/b")) {
        std::cerr << "invalid base ref should roll back\n";
        return 1;
      }
      gw->fail_next(Op::Create, Class::Transient);
      try {
        fleet.spawn("c");
        std::cerr << "transient failure swallowed\n";
        return 1;
      } catch (const treefleet::FleetError &e) {
        if (!e.transient() || !fleet.records().empty()) {
          std::cerr << "transient create should roll back and say so\n";
          return 1;
        }
      }
      if (fleet.spawn("c").agent_id != "c") {
        std::cerr << "retry after rollback failed\n";
        return 1;
      }
    }
    {
      auto mem = std::make_shared<MemoryGateway>();
      auto timed = std::make_shared<treefleet::TimedGateway>(mem, std::chrono::milliseconds(50));
      auto cfg = test_config();
      cfg.gateway_timeout = timed->timeout();
      treefleet::Fleet fleet{cfg, timed, state / "four"};

      mem->delay(Op::Create, std::chrono::milliseconds(400));
      if (kind_of([&] { fleet.spawn("slow"); }) != ErrorKind::Timeout ||
          state_of(fleet, "slow") != WorktreeState::Spawning) {
        std::cerr << "timeout should leave the record Spawning\n";
        return 1;
      }
      if (kind_of([&] { fleet.spawn("slow"); }) != ErrorKind::OperationPending) {
        std::cerr << "spawn over a pending record should refuse\n";
        return 1;
      }
      // the abandoned create still lands; reconcile is what settles it
      std::this_thread::sleep_for(std::chrono::milliseconds(600));
      if (!mem->has_worktree("/fleet/wt/slow")) {
        std::cerr << "abandoned create never finished\n";
        return 1;
      }
    }

    // 4) base ref mismatch policies
    {
      auto gw = std::make_shared<MemoryGateway>();
      gw->add_foreign("/tmp/release", "release");
      gw->vanish("/tmp/release"); // leaves the branch
      auto cfg = test_config();
      treefleet::Fleet reuse{cfg, gw, state / "five"};
      const auto h = reuse.spawn("m", "main");
      if (reuse.spawn("m", "release") != h) {
        std::cerr << "reuse policy should return the existing handle\n";
        return 1;
      }

      cfg.base_mismatch = treefleet::BaseMismatchPolicy::Reject;
      treefleet::Fleet reject{cfg, gw, state / "five"};
      if (kind_of([&] { reject.spawn("m", "release"); }) != ErrorKind::BaseRefMismatch ||
          reject.spawn("m", "main") != h) {
        std::cerr << "reject policy should refuse only a different base\n";
        return 1;
      }
    }

    // 5) a failed removal leaves Removing; nuke again retries it
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{test_config(), gw, state / "six"};
      const auto h = fleet.spawn("r");
      gw->fail_next(Op::Remove, Class::Transient);
      if (kind_of([&] { fleet.nuke("r"); }) != ErrorKind::GatewayFailure ||
          state_of(fleet, "r") != WorktreeState::Removing) {
        std::cerr << "failed removal should leave Removing\n";
        return 1;
      }
      if (kind_of([&] { fleet.spawn("r"); }) != ErrorKind::OperationPending) {
        std::cerr << "spawn during Removing should refuse\n";
        return 1;
      }
      if (fleet.nuke("r") != treefleet::NukeOutcome::Removed || gw->has_worktree(h.path)) {
        std::cerr << "nuke retry should finish the removal\n";
        return 1;
      }
    }

    // 6) a corrupt record blocks spawn and nuke for that agent only
    {
      auto gw = std::make_shared<MemoryGateway>();
      treefleet::Fleet fleet{test_config(), gw, state / "seven"};
      const auto h = fleet.spawn("keep");
      fleet.spawn("other");
      std::ofstream(state / "seven" / "agents" / "keep") << "agent: someone-else\n";

      if (kind_of([&] { fleet.spawn("keep"); }) != ErrorKind::RegistryCorruption ||
          kind_of([&] { fleet.nuke("keep"); }) != ErrorKind::RegistryCorruption ||
          kind_of([&] { fleet.nuke("keep", true); }) != ErrorKind::RegistryCorruption) {
        std::cerr << "corrupt agent should be refused\n";
        return 1;
      }
      if (!gw->has_worktree(h.path) || gw->calls(Op::Remove) != 0) {
        std::cerr << "refusal must not touch the worktree\n";
        return 1;
      }
      if (fleet.nuke("other") != treefleet::NukeOutcome::Removed) {
        std::cerr << "other agents should be unaffected\n";
        return 1;
      }
    }

    std::cout << "lifecycle OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(state);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(state, ec);
  return 0;
}
