// Hex and object-id helpers
#include "treefleet/util.hpp"

#include "treefleet/consts.hpp"
#include "treefleet/hash.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace treefleet {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen)
    return false;
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string compute_blob_hex_oid(std::span<const std::uint8_t> bytes) {
  const std::string hdr = object_header(consts::kTypeBlob, bytes.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + bytes.size());
  store.insert(store.end(), hdr.begin(), hdr.end());
  store.insert(store.end(), bytes.begin(), bytes.end());
  return to_hex(sha1(store));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
}

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace treefleet
