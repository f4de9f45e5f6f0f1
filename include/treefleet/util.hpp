#pragma once
#include <span>
#include <string>
#include <string_view>

namespace treefleet {

// 40 hex digits, either case
auto looks_hex40(std::string_view str) -> bool;

// Blob id for raw bytes without touching the object store.
auto compute_blob_hex_oid(std::span<const std::uint8_t> bytes) -> std::string;

namespace strutil {
  void rstrip_newlines(std::string& str);
  // Strip spaces, tabs and CR/LF at both ends.
  std::string trim(std::string_view sv);
}

}
