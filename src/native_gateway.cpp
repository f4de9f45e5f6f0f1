#include "treefleet/native_gateway.hpp"

#include "treefleet/errors.hpp"
#include "treefleet/fs.hpp"
#include "treefleet/refs.hpp"
#include "treefleet/status.hpp"
#include "treefleet/worktree.hpp"

#include <string>
#include <system_error>

namespace treefleet {

namespace {

bool transient_errc(const std::error_code &ec) {
  return ec == std::errc::resource_unavailable_try_again ||
         ec == std::errc::device_or_resource_busy || ec == std::errc::interrupted ||
         ec == std::errc::too_many_files_open || ec == std::errc::text_file_busy;
}

// Run an engine call, translating its exceptions into GatewayError.
template <class Fn> auto guarded(std::string_view primitive, Fn &&fn) -> decltype(fn()) {
  const std::string name(primitive);
  try {
    return fn();
  } catch (const GatewayError &) {
    throw;
  } catch (const RefLockError &e) {
    throw GatewayError(GatewayError::Class::Transient, name, e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    throw GatewayError(transient_errc(e.code()) ? GatewayError::Class::Transient
                                                : GatewayError::Class::Fatal,
                       name, e.what());
  } catch (const std::system_error &e) {
    throw GatewayError(transient_errc(e.code()) ? GatewayError::Class::Transient
                                                : GatewayError::Class::Fatal,
                       name, e.what());
  } catch (const std::runtime_error &e) {
    throw GatewayError(GatewayError::Class::Fatal, name, e.what());
  }
}

} // namespace

const Repository &NativeGateway::primary(std::string_view primitive) const {
  if (!primary_)
    throw GatewayError(GatewayError::Class::Fatal, std::string(primitive), "repository not open");
  return *primary_;
}

Repository NativeGateway::checkout(std::string_view primitive,
                                   const std::filesystem::path &path) const {
  const auto &repo = primary(primitive);
  if (!fs::exists(path / consts::kMetaDir))
    throw GatewayError(GatewayError::Class::Fatal, std::string(primitive),
                       "no worktree at " + path.string());
  auto wt = Repository::open(path);
  if (!wt.is_linked() || wt.common_dir() != repo.common_dir())
    throw GatewayError(GatewayError::Class::Fatal, std::string(primitive),
                       path.string() + " is not a worktree of " + repo.root().string());
  return wt;
}

void NativeGateway::open(const std::filesystem::path &root) {
  primary_ = guarded("open", [&] {
    auto repo = Repository::open(root);
    if (repo.is_linked())
      throw std::runtime_error(root.string() + " is a linked worktree, not a primary");
    return repo;
  });
}

std::vector<WorktreeEntry> NativeGateway::list_worktrees() {
  return guarded("list_worktrees", [&] {
    std::vector<WorktreeEntry> out;
    for (auto &wt : worktree::list_linked(primary("list_worktrees")))
      out.push_back(WorktreeEntry{
          .path = std::move(wt.path), .branch = std::move(wt.branch), .head_sha = std::move(wt.head)});
    return out;
  });
}

void NativeGateway::create_worktree(const std::filesystem::path &path, const std::string &branch,
                                    const std::string &base_ref) {
  guarded("create_worktree",
          [&] { worktree::add_linked(primary("create_worktree"), path, branch, base_ref); });
}

void NativeGateway::remove_worktree(const std::filesystem::path &path) {
  guarded("remove_worktree", [&] { worktree::remove_linked(primary("remove_worktree"), path); });
}

StatusReport NativeGateway::status(const std::filesystem::path &path) {
  return guarded("status", [&] {
    const auto st = compute_status(checkout("status", path));
    return StatusReport{.clean = st.clean(), .changes = summarize(st)};
  });
}

std::string NativeGateway::commit(const std::filesystem::path &path, const std::string &message,
                                  const Identity &author) {
  return guarded("commit", [&] { return checkout("commit", path).commit_all(message, author); });
}

std::string NativeGateway::head_sha(const std::filesystem::path &path) {
  return guarded("head_sha", [&] {
    auto head = checkout("head_sha", path).head_commit();
    if (!head)
      throw std::runtime_error("worktree " + path.string() + " has no commit");
    return *head;
  });
}

} // namespace treefleet
