#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../src/CacheStore.hpp"
#include "../src/Errors.hpp"
#include "TestUtils.hpp"

namespace fs = std::filesystem;

static void touchLater(const std::string& path, int seconds) {
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(seconds));
}

int main() {
    try {
        TempDir dir("cache_store");
        CacheConfig config;
        config.dataDir = dir.file("share");

        std::string source = dir.file("data.jsonl");
        writeFile(source, numberedLines(3));
        std::string cachePath = config.resolveCachePath(source);

        // 1) Missing and corrupt caches are told apart
        ASSERT_TRUE(CacheStore::load(cachePath).status == LoadStatus::NotFound);
        fs::create_directories(fs::path(cachePath).parent_path());
        writeFile(cachePath, "{not json");
        LoadResult corrupt = CacheStore::load(cachePath);
        ASSERT_TRUE(corrupt.status == LoadStatus::Corrupt);
        ASSERT_TRUE(!corrupt.error.empty());
        writeFile(cachePath, "{\"format_version\":1}");
        ASSERT_TRUE(CacheStore::load(cachePath).status == LoadStatus::Corrupt);
        fs::remove(cachePath);

        // 2) Save then load, no temp files left behind
        CacheRecord built = buildCacheRecord(source, false);
        std::string manual = dir.file("nested/dir/manual.cache.json");
        CacheStore::save(manual, built);
        LoadResult loaded = CacheStore::load(manual);
        ASSERT_TRUE(loaded.status == LoadStatus::Ok);
        ASSERT_TRUE(loaded.record == built);
        size_t entries = 0;
        for (const auto& entry : fs::directory_iterator(dir.file("nested/dir"))) {
            (void)entry;
            ++entries;
        }
        ASSERT_TRUE(entries == 1);

        // overwriting replaces the whole file, never leaving a longer tail behind
        CacheRecord shorter = built;
        shorter.offsets.resize(1);
        CacheStore::save(manual, shorter);
        ASSERT_TRUE(CacheStore::load(manual).record == shorter);
        Json::StreamWriterBuilder compact;
        compact["indentation"] = "";
        ASSERT_TRUE(readAll(manual) == Json::writeString(compact, shorter.toJson()));
        entries = 0;
        for (const auto& entry : fs::directory_iterator(dir.file("nested/dir"))) {
            (void)entry;
            ++entries;
        }
        ASSERT_TRUE(entries == 1);

        // 3) First resolve builds and persists
        CacheRecord first = CacheStore::resolve(source, cachePath, config);
        ASSERT_TRUE(first.lineCount() == 3);
        ASSERT_TRUE(fs::exists(cachePath));
        std::string persisted = readAll(cachePath);

        // 4) A valid cache is reused, not rebuilt
        auto stamp = fs::last_write_time(cachePath);
        CacheRecord second = CacheStore::resolve(source, cachePath, config);
        ASSERT_TRUE(second == first);
        ASSERT_TRUE(fs::last_write_time(cachePath) == stamp);
        ASSERT_TRUE(readAll(cachePath) == persisted);

        // 5) Without checks an appended file keeps the stale count
        appendFile(source, "{\"i\":3}\n");
        ASSERT_TRUE(CacheStore::resolve(source, cachePath, config).lineCount() == 3);

        // 6) Time check catches the change
        touchLater(source, 10);
        CacheConfig timed = config;
        timed.checkCacheTime = true;
        CacheRecord refreshed = CacheStore::resolve(source, cachePath, timed);
        ASSERT_TRUE(refreshed.lineCount() == 4);
        ASSERT_TRUE(refreshed.fingerprint.modifiedTimeNs == fileModifiedTimeNs(source));

        // unchanged file under the time check is a hit
        LoadResult afterTime = CacheStore::load(cachePath);
        ASSERT_TRUE(CacheStore::isValid(afterTime, source, timed));

        // 7) Hash check: a cache built without a hash cannot pass it
        CacheConfig hashed = config;
        hashed.checkCacheHash = true;
        ASSERT_TRUE(!CacheStore::isValid(CacheStore::load(cachePath), source, hashed));
        CacheRecord withHash = CacheStore::resolve(source, cachePath, hashed);
        ASSERT_TRUE(!withHash.fingerprint.contentHash.empty());
        ASSERT_TRUE(CacheStore::isValid(CacheStore::load(cachePath), source, hashed));

        // same mtime, different content: only the hash notices
        auto mtime = fs::last_write_time(source);
        writeFile(source, numberedLines(2) + "{\"x\":1}\n{\"y\":2}\n{\"z\":3}\n");
        fs::last_write_time(source, mtime);
        ASSERT_TRUE(CacheStore::isValid(CacheStore::load(cachePath), source, timed));
        ASSERT_TRUE(!CacheStore::isValid(CacheStore::load(cachePath), source, hashed));
        ASSERT_TRUE(CacheStore::resolve(source, cachePath, hashed).lineCount() == 5);

        // both flags set: both checks apply
        CacheConfig both = config;
        both.checkCacheTime = true;
        both.checkCacheHash = true;
        ASSERT_TRUE(CacheStore::isValid(CacheStore::load(cachePath), source, both));
        touchLater(source, 20);
        ASSERT_TRUE(!CacheStore::isValid(CacheStore::load(cachePath), source, both));

        // 8) force_cache always rebuilds
        CacheConfig forced = config;
        forced.forceCache = true;
        ASSERT_TRUE(!CacheStore::isValid(CacheStore::load(cachePath), source, forced));
        writeFile(cachePath, "{\"garbage\":true}");
        ASSERT_TRUE(CacheStore::resolve(source, cachePath, forced).lineCount() == 5);
        ASSERT_TRUE(CacheStore::load(cachePath).status == LoadStatus::Ok);

        // 9) A corrupt cache is rebuilt even without check flags
        writeFile(cachePath, "[1,2,");
        ASSERT_TRUE(CacheStore::resolve(source, cachePath, config).lineCount() == 5);
        ASSERT_TRUE(CacheStore::load(cachePath).status == LoadStatus::Ok);

        // 10) rebuild ignores validity
        appendFile(source, "{\"w\":4}\n");
        ASSERT_TRUE(CacheStore::rebuild(source, cachePath, config).lineCount() == 6);
        ASSERT_TRUE(CacheStore::load(cachePath).record.lineCount() == 6);

        // 11) Empty source
        std::string empty = dir.file("empty.jsonl");
        writeFile(empty, "");
        CacheRecord emptyRecord = CacheStore::resolve(empty, config.resolveCachePath(empty), config);
        ASSERT_TRUE(emptyRecord.lineCount() == 0);
        ASSERT_TRUE(emptyRecord.fingerprint.sizeBytes == 0);

        // 12) Bad paths
        ASSERT_THROWS(CacheStore::resolve(dir.file("missing.jsonl"), dir.file("m.cache.json"), config),
                      SourceNotFoundError);
        ASSERT_THROWS(CacheStore::resolve(source, source, config), std::invalid_argument);
        ASSERT_TRUE(readAll(source).size() > 0);

        // 13) Concurrent resolvers of one cache agree on the result
        std::string shared = dir.file("shared.jsonl");
        writeFile(shared, numberedLines(500));
        std::string sharedCache = config.resolveCachePath(shared);
        std::atomic<int> failures{0};
        std::atomic<int> wrongCounts{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                try {
                    if (CacheStore::resolve(shared, sharedCache, config).lineCount() != 500) {
                        ++wrongCounts;
                    }
                } catch (const std::exception& e) {
                    std::cerr << "resolver failed: " << e.what() << std::endl;
                    ++failures;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        ASSERT_TRUE(failures == 0);
        ASSERT_TRUE(wrongCounts == 0);
        ASSERT_TRUE(CacheStore::load(sharedCache).record.lineCount() == 500);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All cache store tests passed" << std::endl;
    return 0;
}
