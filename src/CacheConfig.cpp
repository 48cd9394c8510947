#include "CacheConfig.hpp"
#include <cstdlib>
#include <stdexcept>

CacheConfig CacheConfig::fromEnvironment() {
    CacheConfig config;
    if (const char* method = std::getenv("JSONL_CACHE_DIR_METHOD"); method && *method) {
        config.location = parseCacheLocation(method);
    }
    if (const char* dir = std::getenv("JSONL_CACHE_DATA_DIR"); dir && *dir) {
        config.dataDir = dir;
    } else {
        config.dataDir = defaultDataDir();
    }
    return config;
}

namespace {

void readBool(const Json::Value& json, const char* key, bool& out) {
    if (!json.isMember(key)) return;
    if (!json[key].isBool()) {
        throw std::invalid_argument(std::string("Option '") + key + "' must be a boolean");
    }
    out = json[key].asBool();
}

void readInt(const Json::Value& json, const char* key, int& out) {
    if (!json.isMember(key)) return;
    if (!json[key].isInt() || json[key].asInt() < 0) {
        throw std::invalid_argument(std::string("Option '") + key + "' must be a non-negative integer");
    }
    out = json[key].asInt();
}

std::optional<std::string> readString(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || json[key].isNull()) return std::nullopt;
    if (!json[key].isString()) {
        throw std::invalid_argument(std::string("Option '") + key + "' must be a string");
    }
    return json[key].asString();
}

} // namespace

CacheConfig CacheConfig::fromJson(const Json::Value& json, CacheConfig base) {
    if (json.isNull()) {
        return base;
    }
    if (!json.isObject()) {
        throw std::invalid_argument("Cache options must be a JSON object");
    }
    readBool(json, "force_cache", base.forceCache);
    readBool(json, "check_cache_time", base.checkCacheTime);
    readBool(json, "check_cache_hash", base.checkCacheHash);
    if (auto path = readString(json, "cache_path")) {
        base.cachePath = *path;
    }
    if (auto method = readString(json, "dir_method")) {
        base.location = parseCacheLocation(*method);
    }
    if (auto dir = readString(json, "data_dir")) {
        base.dataDir = *dir;
    }
    readInt(json, "lock_timeout_ms", base.lockTimeoutMs);
    readInt(json, "lock_retries", base.lockRetries);
    return base;
}

std::string CacheConfig::resolveCachePath(const std::string& sourcePath) const {
    if (cachePath) {
        return *cachePath;
    }
    return defaultCachePath(sourcePath, location, dataDir.empty() ? defaultDataDir() : dataDir);
}
