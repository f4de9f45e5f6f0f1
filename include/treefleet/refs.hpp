#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace treefleet {

// Another writer holds "<ref>.lock".
class RefLockError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Raw HEAD of one worktree's admin dir ("ref: refs/heads/x\n" or 40-hex), nullopt if absent.
std::optional<std::string> read_HEAD(const std::filesystem::path& admin_dir);

void set_HEAD_symbolic(const std::filesystem::path& admin_dir, const std::string& refname);

// Branch named by a symbolic HEAD, nullopt when detached or missing.
std::optional<std::string> head_branch(const std::filesystem::path& admin_dir);

// Shared refs live in the common dir. Returns the 40-hex id without newline.
std::optional<std::string> read_ref(const std::filesystem::path& common_dir, const std::string& refname);

// Takes "<ref>.lock" exclusively for the duration of the write; throws RefLockError if taken.
void update_ref(const std::filesystem::path& common_dir, const std::string& refname, const std::string& hex_oid);

} // namespace treefleet
