#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>

constexpr int kCacheFormatVersion = 1;

// Source file state captured when a cache was built.
struct Fingerprint {
    uint64_t sizeBytes = 0;
    int64_t modifiedTimeNs = 0;
    std::string contentHash;  // empty when not computed

    bool operator==(const Fingerprint& other) const;
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
};

// Line-start offsets of one JSONL file plus the fingerprint they are valid
// for. Rebuilt wholesale on invalidation, never patched.
struct CacheRecord {
    int formatVersion = kCacheFormatVersion;
    std::string sourcePath;
    std::vector<uint64_t> offsets;
    Fingerprint fingerprint;

    size_t lineCount() const { return offsets.size(); }

    Json::Value toJson() const;
    // Throws CacheCorruptError on missing/mistyped fields, a version mismatch,
    // line_count disagreeing with offsets, or offsets that are not strictly
    // increasing from 0.
    static CacheRecord fromJson(const Json::Value& json);

    bool operator==(const CacheRecord& other) const;
    bool operator!=(const CacheRecord& other) const { return !(*this == other); }
};

// Modification time of `path` in nanoseconds since the epoch (stat(2)).
int64_t fileModifiedTimeNs(const std::string& path);

std::string computeContentHash(const std::string& path);

Fingerprint captureFingerprint(const std::string& path, bool withHash);

// Scan + fingerprint. Throws SourceNotFoundError if `path` is missing.
CacheRecord buildCacheRecord(const std::string& path, bool withHash);
