#include "treefleet/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <zlib.h>

namespace treefleet::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::filesystem::filesystem_error("mkdir -p failed", p.parent_path(), ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("open for read failed: " + p.string());
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    if (!data.empty())
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignore;
    std::filesystem::remove(tmp, ignore);
    throw std::filesystem::filesystem_error("atomic replace failed", p, ec);
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(
      p, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()),
                                       text.size()));
}

bool create_exclusive(const std::filesystem::path &p, std::string_view text) {
  ensure_parent_dir(p);
  const int fd = ::open(p.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
  if (fd < 0) {
    if (errno == EEXIST)
      return false;
    throw std::filesystem::filesystem_error("create failed", p,
                                            std::error_code(errno, std::generic_category()));
  }
  std::size_t off = 0;
  while (off < text.size()) {
    const ssize_t n = ::write(fd, text.data() + off, text.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      const int err = errno;
      ::close(fd);
      throw std::filesystem::filesystem_error("write failed", p,
                                              std::error_code(err, std::generic_category()));
    }
    off += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

bool is_absent_or_empty_dir(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec))
    return true;
  return std::filesystem::is_directory(p, ec) && std::filesystem::is_empty(p, ec);
}

void remove_tree(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  if (ec)
    throw std::filesystem::filesystem_error("remove failed", p, ec);
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::size_t cap = std::max<std::size_t>(data.size() * 3, 64);
  for (int i = 0; i < 8; ++i) {
    std::vector<std::uint8_t> out(cap);
    auto dest_len = static_cast<uLongf>(out.size());
    const int rc = uncompress(out.data(), &dest_len, reinterpret_cast<const Bytef *>(data.data()),
                              static_cast<uLong>(data.size()));
    if (rc == Z_OK) {
      out.resize(dest_len);
      return out;
    }
    if (rc != Z_BUF_ERROR)
      throw std::runtime_error("zlib uncompress failed");
    cap *= 2;
  }
  throw std::runtime_error("zlib uncompress overflow");
}

} // namespace treefleet::fs
