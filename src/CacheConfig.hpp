#pragma once
#include <optional>
#include <string>
#include <json/json.h>
#include "CachePaths.hpp"

// Options governing where a cache lives and when it is rebuilt.
// forceCache overrides both check flags.
struct CacheConfig {
    bool forceCache = false;
    bool checkCacheTime = false;
    bool checkCacheHash = false;
    std::optional<std::string> cachePath;

    CacheLocation location = CacheLocation::User;
    std::string dataDir;

    // per-attempt wait on the build lock, and how many attempts before failing
    int lockTimeoutMs = 2000;
    int lockRetries = 5;

    // Reads JSONL_CACHE_DIR_METHOD ("user"|"local") and JSONL_CACHE_DATA_DIR.
    static CacheConfig fromEnvironment();

    // Overlays recognized keys of `json` onto `base`. Unknown keys are ignored;
    // a key of the wrong type throws std::invalid_argument.
    static CacheConfig fromJson(const Json::Value& json, CacheConfig base = fromEnvironment());

    // Explicit cachePath if set, otherwise the default derived location.
    std::string resolveCachePath(const std::string& sourcePath) const;
};
