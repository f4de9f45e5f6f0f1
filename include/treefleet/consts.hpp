#pragma once
#include <cstdint>
#include <string_view>

namespace treefleet::consts {

// Directory and file names
inline constexpr std::string_view kMetaDir       = ".treefleet";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kWorktreesDir  = "worktrees";
inline constexpr std::string_view kGitdirFile    = "gitdir";
inline constexpr std::string_view kCommondirFile = "commondir";
inline constexpr std::string_view kLockSuffix    = ".lock";
inline constexpr std::string_view kDefaultBranch = "main";

// Fleet bookkeeping under the primary's metadata dir
inline constexpr std::string_view kFleetDir      = "fleet";
inline constexpr std::string_view kAgentsDir     = "agents";
inline constexpr std::string_view kFleetLockFile = "fleet.lock";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile = 0100644;
inline constexpr std::uint32_t kModeTree = 0040000;

// Object id sizes (SHA-1)
inline constexpr std::size_t kOidRawLen = 20;
inline constexpr std::size_t kOidHexLen = 40;

inline constexpr std::size_t kFanoutDirHexLen = 2;

// Header prefixes
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kGitdirPrefix    = "gitdir: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kHeadsPrefix     = "refs/heads/";

inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace treefleet::consts
