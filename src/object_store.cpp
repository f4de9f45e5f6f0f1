#include "treefleet/object_store.hpp"

#include "treefleet/consts.hpp"
#include "treefleet/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace tfs = treefleet::fs;

namespace treefleet {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  return from_hex(hex_oid, id) && tfs::exists(path_for_oid(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id))
    throw std::runtime_error("object_store: bad oid hex: " + std::string(hex_oid));
  const auto path = path_for_oid(id);
  if (!tfs::exists(path))
    throw std::runtime_error("object_store: no such object " + std::string(hex_oid));
  auto store = tfs::z_decompress(tfs::read_file(path));

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end())
    throw std::runtime_error("object_store: invalid header in " + std::string(hex_oid));
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end())
    throw std::runtime_error("object_store: invalid header in " + std::string(hex_oid));

  std::string type(store.begin(), it_space);
  return Object{.type = std::move(type), .data = {it_nul + 1, store.end()}};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), hdr.begin(), hdr.end());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid id = sha1(store);
  const auto path = path_for_oid(id);
  if (!tfs::exists(path))
    tfs::write_file_atomic(path, tfs::z_compress(store));
  return to_hex(id);
}

} // namespace treefleet
