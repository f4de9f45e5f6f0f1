#pragma once
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace treefleet::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Write to "<p>.tmp" then rename over p.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Create p with O_EXCL. Returns false if it already exists.
bool create_exclusive(const std::filesystem::path& p, std::string_view text);

// True if p is missing or an empty directory.
bool is_absent_or_empty_dir(const std::filesystem::path& p);

void remove_tree(const std::filesystem::path& p);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace treefleet::fs
