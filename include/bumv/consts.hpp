#pragma once
#include <cstddef>
#include <string_view>

namespace bumv::consts {

inline constexpr std::string_view kProgramName = "bumv";
inline constexpr std::string_view kVersion     = "0.3.0";

// Ignore files honoured by the traversal (unless --no-ignore)
inline constexpr std::string_view kGitIgnoreFile = ".gitignore";
inline constexpr std::string_view kIgnoreFile    = ".ignore";

// Editor defaults
inline constexpr std::string_view kVsCode     = "code";
inline constexpr std::string_view kVsCodeWait = "--wait";
inline constexpr std::string_view kDefaultEditor = kVsCode;

// ——— Temporary list file handed to the editor ———
inline constexpr std::string_view kListFilePrefix = "bumv-";
inline constexpr std::string_view kListFileSuffix = ".txt";

// ——— Temporary names used to break rename cycles ———
// "<filename>.bumv-<hex>.tmp"
inline constexpr std::string_view kTempInfix  = ".bumv-";
inline constexpr std::string_view kTempSuffix = ".tmp";
inline constexpr std::size_t kTempHexLen      = 8;
inline constexpr int kMaxTempAttempts         = 64;

// ——— Rename log ———
inline constexpr std::string_view kLogPrefix       = "bumv_";
inline constexpr std::string_view kLogSuffix       = ".log";
inline constexpr std::string_view kLogSnapshotLine = "# snapshot ";

// ——— Settings file ———
inline constexpr std::string_view kConfigDir  = "bumv";
inline constexpr std::string_view kConfigFile = "config";

inline constexpr std::string_view kKeyEditor   = "editor:";
inline constexpr std::string_view kKeyRecursive = "recursive:";
inline constexpr std::string_view kKeyNoIgnore = "no-ignore:";
inline constexpr std::string_view kKeyNoLog    = "no-log:";

// ——— SHA-1 sizes ———
inline constexpr std::size_t kSha1RawLen = 20;
inline constexpr std::size_t kSha1HexLen = 40;

// ——— Common characters ———
inline constexpr char kLF  = '\n';
inline constexpr char kTab = '\t';
inline constexpr char kNul = '\0';

} // namespace bumv::consts
