#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace treefleet {

// Raw 20-byte SHA-1 object id
using oid = std::array<std::uint8_t, 20>;

/**
 * SHA-1 over arbitrary bytes.
 * Object ids hash "<type> <size>\\0" + payload; build the prefix with object_header().
 */
oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

std::string to_hex(const oid &id);

// False on bad length or non-hex characters.
bool from_hex(std::string_view hex, oid &out);

inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

} // namespace treefleet
