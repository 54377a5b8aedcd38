#pragma once
#include <cstddef>
#include <string_view>

namespace changeview::consts {

inline constexpr std::string_view kVersion = "0.3.0";

// Repository layout
inline constexpr std::string_view kGitDir     = ".git";
inline constexpr std::string_view kConfigFile = ".changeview";
inline constexpr std::string_view kGitProgram = "git";

// ——— Refs ———
inline constexpr std::string_view kHead          = "HEAD";
inline constexpr std::string_view kHeadParent    = "HEAD~1";
inline constexpr std::string_view kDefaultBase   = "main";
inline constexpr std::string_view kFallbackBase  = "master";
inline constexpr std::string_view kRemotePrefix  = "origin/";
inline constexpr std::string_view kUncommitted   = "uncommitted";

// ——— Numstat ———
inline constexpr char kFieldSep = '\t';
inline constexpr std::string_view kBinaryMarker = "-";
inline constexpr std::string_view kRenameArrow  = " => ";

// ——— Tree connectors (UTF-8 box drawing) ———
inline constexpr std::string_view kBranch      = "├── ";
inline constexpr std::string_view kCorner      = "└── ";
inline constexpr std::string_view kPipeIndent  = "│   ";
inline constexpr std::string_view kBlankIndent = "    ";
inline constexpr std::string_view kRootName    = ".";

// ——— ANSI ———
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed   = "\033[31m";
inline constexpr std::string_view kReset = "\033[0m";

// Absent line count
inline constexpr std::string_view kNoLoc = "-";

// ——— Commit descriptors ———
inline constexpr std::size_t kShortHashLen = 6;
inline constexpr std::size_t kMaxMessageLen = 50;
inline constexpr std::string_view kEllipsis = "...";

// git treats content with a NUL in this prefix as binary
inline constexpr std::size_t kBinarySniffLen = 8000;

// ——— Common characters ———
inline constexpr char kLF = '\n';
inline constexpr char kCR = '\r';
inline constexpr char kNul = '\0';

} // namespace changeview::consts
