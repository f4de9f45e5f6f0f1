#include "treefleet/refs.hpp"

#include "treefleet/consts.hpp"
#include "treefleet/fs.hpp"
#include "treefleet/util.hpp"

#include <string>
#include <string_view>

namespace treefleet {

static std::filesystem::path head_file(const std::filesystem::path &admin_dir) {
  return admin_dir / consts::kHeadFile;
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

std::optional<std::string> read_HEAD(const std::filesystem::path &admin_dir) {
  const auto p = head_file(admin_dir);
  if (!fs::exists(p))
    return std::nullopt;
  return fs::read_text(p);
}

void set_HEAD_symbolic(const std::filesystem::path &admin_dir, const std::string &refname) {
  fs::write_text_atomic(head_file(admin_dir), std::string(consts::kRefPrefix) + refname + "\n");
}

std::optional<std::string> head_branch(const std::filesystem::path &admin_dir) {
  auto head = read_HEAD(admin_dir);
  if (!head || !head->starts_with(consts::kRefPrefix))
    return std::nullopt;
  std::string rn = head->substr(consts::kRefPrefix.size());
  strutil::rstrip_newlines(rn);
  if (!rn.starts_with(consts::kHeadsPrefix))
    return std::nullopt;
  return rn.substr(consts::kHeadsPrefix.size());
}

std::optional<std::string> read_ref(const std::filesystem::path &common_dir,
                                    const std::string &refname) {
  const auto p = common_dir / refname;
  if (!fs::exists(p))
    return std::nullopt;
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

void update_ref(const std::filesystem::path &common_dir, const std::string &refname,
                const std::string &hex_oid) {
  const auto p = common_dir / refname;
  auto lock = p;
  lock += consts::kLockSuffix;
  if (!fs::create_exclusive(lock, hex_oid))
    throw RefLockError("ref is locked: " + refname);
  try {
    fs::write_text_atomic(p, hex_oid + "\n");
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(lock, ec);
    throw;
  }
  std::error_code ec;
  std::filesystem::remove(lock, ec);
}

} // namespace treefleet
