#pragma once
#include <string>
#include "CacheConfig.hpp"
#include "CacheRecord.hpp"

enum class LoadStatus {
    Ok,
    NotFound,
    Corrupt
};

struct LoadResult {
    LoadStatus status = LoadStatus::NotFound;
    CacheRecord record;  // meaningful only when status == Ok
    std::string error;   // reason when status == Corrupt
};

// Persistence and validity decisions for cache records.
//
// Writes go to a temp file in the target directory and are renamed into
// place, so readers never see a partial file and loading needs no lock.
// Building is serialized per cache path with a NamedLock.
class CacheStore {
public:
    static LoadResult load(const std::string& cachePath);

    // Creates parent directories. Throws std::runtime_error on I/O failure.
    static void save(const std::string& cachePath, const CacheRecord& record);

    static bool isValid(const LoadResult& loaded, const std::string& sourcePath, const CacheConfig& config);

    // Returns a record valid for `sourcePath` under `config`, loading the
    // existing cache or building and saving a new one.
    static CacheRecord resolve(const std::string& sourcePath, const std::string& cachePath, const CacheConfig& config);

    // Unconditional rebuild and save under the build lock.
    static CacheRecord rebuild(const std::string& sourcePath, const std::string& cachePath, const CacheConfig& config);
};
