#pragma once
#include <string>

enum class CacheLocation {
    User,   // under the user's data directory
    Local   // beside the source file
};

constexpr const char* kCacheExtension = ".cache.json";

// "user" or "local"; throws std::invalid_argument otherwise.
CacheLocation parseCacheLocation(const std::string& name);

// First 16 hex characters of the SHA-256 of `text`.
std::string shortPathHash(const std::string& text);

// Deterministic default cache location for `sourcePath`. Pure: nothing is
// created on disk and no process state is consulted.
//   User:  <dataDir>/jsonl_cache/<abs path, '/' -> "--">/<hash>.cache.json
//   Local: <source dir>/.jsonl_cache/<stem>/<hash of file name>.cache.json
std::string defaultCachePath(const std::string& sourcePath, CacheLocation location, const std::string& dataDir);

// <cache dir>/.locks/<cache file name>.lock
std::string lockPathFor(const std::string& cachePath);

// $XDG_DATA_HOME, else $HOME/.local/share, else the temp directory.
std::string defaultDataDir();
