#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "CacheConfig.hpp"

struct PrecacheResult {
    std::string path;
    bool ok = false;
    std::string error;
    size_t lineCount = 0;
};

// Called once per finished file with its 1-based completion count.
using PrecacheProgress = std::function<void(size_t done, size_t total, const PrecacheResult&)>;

// Builds or validates the cache of every file without keeping readers.
// Failures are recorded per file and never stop the remaining files.
// threads > 1 processes files concurrently; results keep input order.
std::vector<PrecacheResult> precacheFiles(const std::vector<std::string>& files,
                                          size_t threads,
                                          const CacheConfig& config,
                                          PrecacheProgress progress = nullptr);

// "(i/n) Caching completed successfully." or "(i/n) Caching failed with: ..."
std::string formatPrecacheMessage(size_t done, size_t total, const PrecacheResult& result);

// "a.jsonl,b.jsonl" -> {"a.jsonl", "b.jsonl"}; empty items are dropped.
std::vector<std::string> splitFileList(const std::string& list);
