#pragma once
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>

namespace treefleet {

// Exclusive per-repository lock for spawn, nuke and reconcile. Waiters inside the process are
// admitted in arrival order (ticket lock); the holder additionally takes flock(LOCK_EX) on
// `lock_file` so other processes on the same repository are excluded. An empty path skips
// the file lock.
class StructuralLock {
public:
  class Guard {
  public:
    Guard(Guard&& other) noexcept : lock_(other.lock_) { other.lock_ = nullptr; }
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

  private:
    friend class StructuralLock;
    explicit Guard(StructuralLock* lock) : lock_(lock) {}
    StructuralLock* lock_;
  };

  explicit StructuralLock(std::filesystem::path lock_file = {});
  StructuralLock(const StructuralLock&) = delete;
  StructuralLock& operator=(const StructuralLock&) = delete;

  [[nodiscard]] Guard acquire();

private:
  void release() noexcept;
  void admit_next() noexcept;

  std::filesystem::path lock_file_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::uint64_t next_ticket_ = 0;
  std::uint64_t serving_ = 0;
  int fd_ = -1;
};

} // namespace treefleet
