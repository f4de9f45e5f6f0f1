#include "treefleet/structural_lock.hpp"

#include "treefleet/fs.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>

namespace treefleet {

StructuralLock::StructuralLock(std::filesystem::path lock_file)
    : lock_file_(std::move(lock_file)) {}

StructuralLock::Guard::~Guard() {
  if (lock_)
    lock_->release();
}

StructuralLock::Guard StructuralLock::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  const std::uint64_t ticket = next_ticket_++;
  cv_.wait(lk, [&] { return serving_ == ticket; });
  lk.unlock();

  if (lock_file_.empty())
    return Guard{this};

  try {
    fs::ensure_parent_dir(lock_file_);
  } catch (...) {
    admit_next();
    throw;
  }
  const int fd = ::open(lock_file_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int err = errno;
    admit_next();
    throw std::runtime_error("open " + lock_file_.string() + " failed: " + std::strerror(err));
  }
  while (::flock(fd, LOCK_EX) != 0) {
    if (errno == EINTR)
      continue;
    const int err = errno;
    ::close(fd);
    admit_next();
    throw std::runtime_error("flock " + lock_file_.string() + " failed: " + std::strerror(err));
  }
  fd_ = fd;
  return Guard{this};
}

void StructuralLock::release() noexcept {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
  admit_next();
}

void StructuralLock::admit_next() noexcept {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++serving_;
  }
  cv_.notify_all();
}

} // namespace treefleet
