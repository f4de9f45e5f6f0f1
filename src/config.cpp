#include "treefleet/config.hpp"

#include "treefleet/consts.hpp"
#include "treefleet/fs.hpp"
#include "treefleet/util.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>

namespace {

long long parse_count(std::string_view key, const std::string &value) {
  long long out = 0;
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc{} || ptr != end || out < 0)
    throw std::runtime_error("config: bad value for " + std::string(key) + ": '" + value + "'");
  return out;
}

std::filesystem::path cfg_path(const std::filesystem::path &common_dir) {
  return common_dir / treefleet::consts::kConfigFile;
}

} // namespace

namespace treefleet {

std::string_view to_string(OrphanPolicy p) {
  switch (p) {
  case OrphanPolicy::Report:
    return "report";
  case OrphanPolicy::Adopt:
    return "adopt";
  case OrphanPolicy::Remove:
    return "remove";
  }
  return "report";
}

std::string_view to_string(BaseMismatchPolicy p) {
  return p == BaseMismatchPolicy::Reject ? "reject" : "reuse";
}

FleetConfig load_config(const std::filesystem::path &common_dir) {
  FleetConfig out{};
  const auto primary = common_dir.parent_path();
  out.worktree_root = primary.parent_path() / (primary.filename().string() + ".worktrees");

  const auto path = cfg_path(common_dir);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));
  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue;
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = strutil::trim(sv.substr(0, colon));
    const std::string value = strutil::trim(sv.substr(colon + 1));

    if (key == "author") {
      out.identity.name = value;
    } else if (key == "email") {
      out.identity.email = value;
    } else if (key == "worktree_root") {
      std::filesystem::path p{value};
      out.worktree_root = p.is_absolute() ? p : primary / p;
    } else if (key == "branch_prefix") {
      out.branch_prefix = value;
    } else if (key == "gateway_timeout_ms") {
      out.gateway_timeout = std::chrono::milliseconds(parse_count(key, value));
    } else if (key == "stale_after_s") {
      out.stale_after = std::chrono::seconds(parse_count(key, value));
    } else if (key == "orphan_policy") {
      if (value == "report")
        out.orphan_policy = OrphanPolicy::Report;
      else if (value == "adopt")
        out.orphan_policy = OrphanPolicy::Adopt;
      else if (value == "remove")
        out.orphan_policy = OrphanPolicy::Remove;
      else
        throw std::runtime_error("config: orphan_policy must be report|adopt|remove, got '" +
                                 value + "'");
    } else if (key == "base_mismatch") {
      if (value == "reuse")
        out.base_mismatch = BaseMismatchPolicy::Reuse;
      else if (value == "reject")
        out.base_mismatch = BaseMismatchPolicy::Reject;
      else
        throw std::runtime_error("config: base_mismatch must be reuse|reject, got '" + value +
                                 "'");
    }
  }
  // An abandoned gateway call may still land until its timeout has passed; a record is only
  // treated as stale once that can no longer happen.
  if (out.gateway_timeout.count() > 0 && out.stale_after <= out.gateway_timeout)
    throw std::runtime_error("config: stale_after_s must exceed gateway_timeout_ms");
  return out;
}

void save_config(const std::filesystem::path &common_dir, const FleetConfig &cfg) {
  std::ostringstream os;
  os << "author: " << cfg.identity.name << '\n'
     << "email: " << cfg.identity.email << '\n'
     << "worktree_root: " << cfg.worktree_root.string() << '\n'
     << "branch_prefix: " << cfg.branch_prefix << '\n'
     << "gateway_timeout_ms: " << cfg.gateway_timeout.count() << '\n'
     << "stale_after_s: " << cfg.stale_after.count() << '\n'
     << "orphan_policy: " << to_string(cfg.orphan_policy) << '\n'
     << "base_mismatch: " << to_string(cfg.base_mismatch) << '\n';
  fs::write_text_atomic(cfg_path(common_dir), os.str());
}

std::optional<Identity> parse_identity(std::string_view text) {
  const auto lt = text.find('<');
  const auto gt = text.rfind('>');
  if (lt == std::string_view::npos || gt == std::string_view::npos || gt < lt)
    return std::nullopt;
  Identity id{.name = strutil::trim(text.substr(0, lt)),
              .email = strutil::trim(text.substr(lt + 1, gt - lt - 1))};
  if (id.name.empty() || id.email.empty())
    return std::nullopt;
  return id;
}

} // namespace treefleet
