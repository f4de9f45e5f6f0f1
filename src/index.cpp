#include "treefleet/index.hpp"

#include "treefleet/fs.hpp"
#include "treefleet/object_store.hpp"
#include "treefleet/util.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace treefleet {

Index::Index(std::filesystem::path index_file) : index_file_(std::move(index_file)) {}

void Index::sort_entries() {
  std::ranges::sort(entries_, [](auto &a, auto &b) { return a.path < b.path; });
}

void Index::load() {
  entries_.clear();
  if (!fs::exists(index_file_))
    return;

  std::istringstream in(fs::read_text(index_file_));
  std::string line;
  while (std::getline(in, line)) {
    line = strutil::trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    std::istringstream is(line);
    std::string mode_str, hex, path;
    if (!(is >> mode_str >> hex))
      throw std::runtime_error("index: malformed line in " + index_file_.string());
    std::getline(is, path);
    path = strutil::trim(path);

    std::uint32_t mode = 0;
    for (const char c : mode_str) {
      if (c < '0' || c > '7') {
        mode = 0;
        break;
      }
      mode = (mode << 3) + static_cast<std::uint32_t>(c - '0');
    }
    IndexEntry e{};
    if (mode == 0 || path.empty() || !from_hex(hex, e.oid))
      throw std::runtime_error("index: malformed entry '" + line + "'");
    e.mode = mode;
    e.path = std::move(path);
    entries_.push_back(std::move(e));
  }
  sort_entries();
}

void Index::save() const {
  std::ostringstream os;
  for (const auto &e : entries_) {
    char mode_buf[16];
    std::snprintf(mode_buf, sizeof(mode_buf), "%o", e.mode);
    os << mode_buf << ' ' << to_hex(e.oid) << ' ' << e.path << '\n';
  }
  fs::write_text_atomic(index_file_, os.str());
}

void Index::add_path(const std::filesystem::path &work_root, std::string_view relpath,
                     const ObjectStore &store, std::uint32_t mode) {
  const auto bytes = fs::read_file(work_root / std::filesystem::path(relpath));
  const auto hex_oid = store.write(consts::kTypeBlob, bytes);

  oid bin{};
  if (!from_hex(hex_oid, bin))
    throw std::runtime_error("blob write produced bad hex oid");

  std::string path(relpath);
  auto it = std::ranges::find_if(entries_, [&](const IndexEntry &e) { return e.path == path; });
  if (it != entries_.end()) {
    it->mode = mode;
    it->oid = bin;
  } else {
    entries_.push_back(IndexEntry{.mode = mode, .oid = bin, .path = std::move(path)});
    sort_entries();
  }
}

void Index::remove_path(std::string_view relpath) {
  const std::string key(relpath);
  std::erase_if(entries_, [&](const IndexEntry &e) { return e.path == key; });
}

void Index::assign(const std::map<std::string, std::string> &path_oids, std::uint32_t mode) {
  entries_.clear();
  for (const auto &[path, hex] : path_oids) {
    IndexEntry e{.mode = mode, .oid = {}, .path = path};
    if (!from_hex(hex, e.oid))
      throw std::runtime_error("index: bad blob id for " + path);
    entries_.push_back(std::move(e));
  }
  sort_entries();
}

std::map<std::string, std::string> Index::as_path_oid_map() const {
  std::map<std::string, std::string> m;
  for (const auto &e : entries_)
    m[e.path] = to_hex(e.oid);
  return m;
}

} // namespace treefleet
