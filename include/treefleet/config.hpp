#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace treefleet {

struct Identity {
  std::string name;
  std::string email;
};

// What the reconciler does with a worktree the registry does not know about.
enum class OrphanPolicy : std::uint8_t { Report, Adopt, Remove };

// What spawn does when a live record exists but was created from a different base ref.
enum class BaseMismatchPolicy : std::uint8_t { Reuse, Reject };

struct FleetConfig {
  Identity identity{.name = "treefleet", .email = "treefleet@localhost"};
  std::filesystem::path worktree_root;
  std::string branch_prefix = "fleet/";
  std::chrono::milliseconds gateway_timeout{30000};
  std::chrono::seconds stale_after{300};
  OrphanPolicy orphan_policy = OrphanPolicy::Report;
  BaseMismatchPolicy base_mismatch = BaseMismatchPolicy::Reuse;
};

std::string_view to_string(OrphanPolicy p);
std::string_view to_string(BaseMismatchPolicy p);

// Read <common_dir>/config. Missing keys keep their defaults; worktree_root defaults to
// "<primary parent>/<primary name>.worktrees". Throws on malformed values.
FleetConfig load_config(const std::filesystem::path& common_dir);

void save_config(const std::filesystem::path& common_dir, const FleetConfig& cfg);

// "Name <email>" -> Identity
std::optional<Identity> parse_identity(std::string_view text);

} // namespace treefleet
