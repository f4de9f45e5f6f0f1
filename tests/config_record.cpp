#include "treefleet/config.hpp"
#include "treefleet/record.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

int main() {
  const fs::path root = fs::temp_directory_path() /
                        ("treefleet_config_" + std::to_string(std::random_device{}()));
  const fs::path common = root / "proj" / ".treefleet";
  fs::create_directories(common);

  try {
    // defaults
    auto cfg = treefleet::load_config(common);
    if (cfg.worktree_root != root / "proj.worktrees" || cfg.branch_prefix != "fleet/" ||
        cfg.gateway_timeout.count() != 30000 || cfg.stale_after.count() != 300 ||
        cfg.orphan_policy != treefleet::OrphanPolicy::Report ||
        cfg.base_mismatch != treefleet::BaseMismatchPolicy::Reuse) {
      std::cerr << "unexpected defaults\n";
      return 1;
    }

    // save/load keeps every key; relative worktree_root is relative to the primary
    cfg.identity = {.name = "Bot", .email = "bot@example.com"};
    cfg.orphan_policy = treefleet::OrphanPolicy::Adopt;
    cfg.base_mismatch = treefleet::BaseMismatchPolicy::Reject;
    cfg.gateway_timeout = std::chrono::milliseconds(0);
    treefleet::save_config(common, cfg);
    auto back = treefleet::load_config(common);
    if (back.identity.name != "Bot" || back.identity.email != "bot@example.com" ||
        back.orphan_policy != treefleet::OrphanPolicy::Adopt ||
        back.base_mismatch != treefleet::BaseMismatchPolicy::Reject ||
        back.gateway_timeout.count() != 0 || back.worktree_root != cfg.worktree_root) {
      std::cerr << "config round trip lost values\n";
      return 1;
    }

    std::ofstream(common / "config") << "# comment\nworktree_root: trees\nunknown: 1\n";
    if (treefleet::load_config(common).worktree_root != root / "proj" / "trees") {
      std::cerr << "relative worktree_root not resolved\n";
      return 1;
    }

    for (const char *bad : {"orphan_policy: maybe\n", "stale_after_s: soon\n",
                            "gateway_timeout_ms: -5\n",
                            "gateway_timeout_ms: 60000\nstale_after_s: 30\n"}) {
      std::ofstream(common / "config") << bad;
      bool threw = false;
      try {
        (void)treefleet::load_config(common);
      } catch (const std::runtime_error &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "accepted bad config: " << bad;
        return 1;
      }
    }

    auto who = treefleet::parse_identity("Ada Lovelace <ada@example.com>");
    if (!who || who->name != "Ada Lovelace" || who->email != "ada@example.com" ||
        treefleet::parse_identity("no email here")) {
      std::cerr << "parse_identity\n";
      return 1;
    }

    // agent ids double as file names and branch components
    for (const char *ok : {"agent-1", "polecat-worker-1", "a.b_c"}) {
      if (!treefleet::valid_agent_id(ok)) {
        std::cerr << "rejected " << ok << "\n";
        return 1;
      }
    }
    for (const char *bad : {"", "-x", ".hidden", "a/b", "a..b", "sp ace"}) {
      if (treefleet::valid_agent_id(bad)) {
        std::cerr << "accepted '" << bad << "'\n";
        return 1;
      }
    }

    // record text survives parsing, including an empty head
    const auto t = std::chrono::system_clock::time_point{std::chrono::milliseconds(1714412345123)};
    const treefleet::WorktreeRecord rec{.agent_id = "agent-1",
                                        .path = "/w/agent-1",
                                        .branch = "fleet/agent-1",
                                        .base_ref = "main",
                                        .state = treefleet::WorktreeState::Committing,
                                        .created_at = t,
                                        .last_transition_at = t,
                                        .head_sha = {}};
    const auto parsed = treefleet::parse_record(treefleet::serialize_record(rec));
    if (parsed.agent_id != rec.agent_id || parsed.state != rec.state ||
        parsed.created_at != t || !parsed.head_sha.empty()) {
      std::cerr << "record text mismatch\n";
      return 1;
    }
    bool threw = false;
    try {
      (void)treefleet::parse_record("agent: x\nstate: Sleeping\n");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "incomplete record accepted\n";
      return 1;
    }

    std::cout << "config_record OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
