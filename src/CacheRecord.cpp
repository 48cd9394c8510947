#include "CacheRecord.hpp"
#include "ContentHash.hpp"
#include "Errors.hpp"
#include "OffsetScanner.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

bool Fingerprint::operator==(const Fingerprint& other) const {
    return sizeBytes == other.sizeBytes &&
           modifiedTimeNs == other.modifiedTimeNs &&
           contentHash == other.contentHash;
}

bool CacheRecord::operator==(const CacheRecord& other) const {
    return formatVersion == other.formatVersion &&
           sourcePath == other.sourcePath &&
           offsets == other.offsets &&
           fingerprint == other.fingerprint;
}

Json::Value CacheRecord::toJson() const {
    Json::Value json(Json::objectValue);
    json["format_version"] = formatVersion;
    json["source_path"] = sourcePath;
    json["line_count"] = (Json::Value::UInt64)offsets.size();

    Json::Value lines(Json::arrayValue);
    lines.resize(static_cast<Json::ArrayIndex>(offsets.size()));
    for (size_t i = 0; i < offsets.size(); ++i) {
        lines[static_cast<Json::ArrayIndex>(i)] = (Json::Value::UInt64)offsets[i];
    }
    json["offsets"] = std::move(lines);

    json["fingerprint"]["size_bytes"] = (Json::Value::UInt64)fingerprint.sizeBytes;
    json["fingerprint"]["modified_time_ns"] = (Json::Value::Int64)fingerprint.modifiedTimeNs;
    if (fingerprint.contentHash.empty()) {
        json["fingerprint"]["content_hash"] = Json::Value(Json::nullValue);
    } else {
        json["fingerprint"]["content_hash"] = fingerprint.contentHash;
    }
    return json;
}

namespace {

const Json::Value& requireMember(const Json::Value& json, const char* key) {
    if (!json.isObject() || !json.isMember(key)) {
        throw CacheCorruptError(std::string("Cache is missing field '") + key + "'");
    }
    return json[key];
}

uint64_t requireUInt64(const Json::Value& json, const char* key) {
    const Json::Value& value = requireMember(json, key);
    if (!value.isUInt64()) {
        throw CacheCorruptError(std::string("Cache field '") + key + "' is not an unsigned integer");
    }
    return value.asUInt64();
}

} // namespace

CacheRecord CacheRecord::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw CacheCorruptError("Cache root is not an object");
    }
    const Json::Value& version = requireMember(json, "format_version");
    if (!version.isInt()) {
        throw CacheCorruptError("Cache field 'format_version' is not an integer");
    }
    if (version.asInt() != kCacheFormatVersion) {
        throw CacheCorruptError("Cache format version " + std::to_string(version.asInt()) +
                                " does not match expected version " + std::to_string(kCacheFormatVersion));
    }

    CacheRecord record;
    record.formatVersion = version.asInt();

    const Json::Value& source = requireMember(json, "source_path");
    if (!source.isString()) {
        throw CacheCorruptError("Cache field 'source_path' is not a string");
    }
    record.sourcePath = source.asString();

    const Json::Value& lines = requireMember(json, "offsets");
    if (!lines.isArray()) {
        throw CacheCorruptError("Cache field 'offsets' is not an array");
    }
    record.offsets.reserve(lines.size());
    for (const auto& entry : lines) {
        if (!entry.isUInt64()) {
            throw CacheCorruptError("Cache offsets contain a non-integer entry");
        }
        uint64_t offset = entry.asUInt64();
        if (record.offsets.empty() ? offset != 0 : offset <= record.offsets.back()) {
            throw CacheCorruptError("Cache offsets are not strictly increasing from 0");
        }
        record.offsets.push_back(offset);
    }
    if (requireUInt64(json, "line_count") != record.offsets.size()) {
        throw CacheCorruptError("Cache line_count does not match the number of offsets");
    }

    const Json::Value& fp = requireMember(json, "fingerprint");
    record.fingerprint.sizeBytes = requireUInt64(fp, "size_bytes");
    const Json::Value& mtime = requireMember(fp, "modified_time_ns");
    if (!mtime.isInt64()) {
        throw CacheCorruptError("Cache field 'modified_time_ns' is not an integer");
    }
    record.fingerprint.modifiedTimeNs = mtime.asInt64();
    const Json::Value& hash = fp.get("content_hash", Json::Value(Json::nullValue));
    if (hash.isString()) {
        record.fingerprint.contentHash = hash.asString();
    } else if (!hash.isNull()) {
        throw CacheCorruptError("Cache field 'content_hash' is neither a string nor null");
    }

    if (!record.offsets.empty() && record.offsets.back() >= record.fingerprint.sizeBytes) {
        throw CacheCorruptError("Cache offsets exceed the recorded file size");
    }
    return record;
}

int64_t fileModifiedTimeNs(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw SourceNotFoundError(path);
        }
        throw std::runtime_error("stat failed for " + path + ": " + std::strerror(errno));
    }
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
}

std::string computeContentHash(const std::string& path) {
    return sha256FileHex(path);
}

Fingerprint captureFingerprint(const std::string& path, bool withHash) {
    Fingerprint fingerprint;
    fingerprint.modifiedTimeNs = fileModifiedTimeNs(path);
    fingerprint.sizeBytes = std::filesystem::file_size(path);
    if (withHash) {
        fingerprint.contentHash = computeContentHash(path);
    }
    return fingerprint;
}

CacheRecord buildCacheRecord(const std::string& path, bool withHash) {
    CacheRecord record;
    record.sourcePath = std::filesystem::absolute(path).lexically_normal().generic_string();
    // fingerprint first: a concurrent append then shows up as a later mtime
    record.fingerprint = captureFingerprint(path, withHash);
    record.offsets = scanFileOffsets(path);
    return record;
}
