#include "Precache.hpp"
#include "CacheStore.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

PrecacheResult precacheOne(const std::string& path, const CacheConfig& config) {
    PrecacheResult result;
    result.path = path;
    try {
        CacheRecord record = CacheStore::resolve(path, config.resolveCachePath(path), config);
        result.ok = true;
        result.lineCount = record.lineCount();
    } catch (const std::exception& e) {
        result.error = e.what();
        spdlog::debug("Precache of {} failed: {}", path, result.error);
    }
    return result;
}

} // namespace

std::vector<PrecacheResult> precacheFiles(const std::vector<std::string>& files,
                                          size_t threads,
                                          const CacheConfig& config,
                                          PrecacheProgress progress) {
    std::vector<PrecacheResult> results(files.size());
    std::mutex progressMutex;
    size_t done = 0;
    auto finish = [&](size_t index, PrecacheResult result) {
        std::lock_guard lock(progressMutex);
        results[index] = std::move(result);
        ++done;
        if (progress) {
            progress(done, files.size(), results[index]);
        }
    };

    if (threads <= 1 || files.size() <= 1) {
        for (size_t i = 0; i < files.size(); ++i) {
            finish(i, precacheOne(files[i], config));
        }
        return results;
    }

    std::atomic<size_t> next{0};
    std::vector<std::future<void>> workers;
    size_t workerCount = std::min(threads, files.size());
    workers.reserve(workerCount);
    for (size_t w = 0; w < workerCount; ++w) {
        workers.push_back(std::async(std::launch::async, [&]() {
            for (size_t i = next++; i < files.size(); i = next++) {
                finish(i, precacheOne(files[i], config));
            }
        }));
    }
    for (auto& worker : workers) {
        worker.get();
    }
    return results;
}

std::string formatPrecacheMessage(size_t done, size_t total, const PrecacheResult& result) {
    std::stringstream ss;
    ss << "(" << done << "/" << total << ") ";
    if (result.ok) {
        ss << "Caching completed successfully.";
    } else {
        ss << "Caching failed with: " << result.error;
    }
    return ss.str();
}

std::vector<std::string> splitFileList(const std::string& list) {
    std::vector<std::string> files;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            files.push_back(item);
        }
    }
    return files;
}
