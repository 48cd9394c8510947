#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include "JsonlReader.hpp"

// Open readers keyed by canonical file path (the handler). Repeated opens
// share one reader and bump its reference count. Each entry carries its own
// mutex so server threads never interleave seeks on one reader.
class ReaderRegistry {
public:
    // Returns the handler. Throws if the path is not allowed or missing.
    std::string open(const std::string& path, const CacheConfig& config);

    // Runs fn(JsonlReader&) with the entry locked; throws std::runtime_error
    // for an unknown handler.
    template <typename Fn>
    auto withReader(const std::string& handler, Fn&& fn) {
        auto entry = find(handler);
        if (!entry) {
            throw std::runtime_error("Invalid handler: " + handler);
        }
        std::lock_guard lock(entry->mutex);
        return fn(*entry->reader);
    }

    // Drops one reference; the reader is released when none remain.
    // Returns false for an unknown handler.
    bool close(const std::string& handler);

    std::vector<std::string> listHandlers() const;
    void setAllowedPaths(const std::vector<std::string>& paths);
    bool isPathAllowed(const std::string& path) const;

private:
    struct Entry {
        std::unique_ptr<JsonlReader> reader;
        std::mutex mutex;
        int refcount = 1;
    };

    std::shared_ptr<Entry> find(const std::string& handler) const;

    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    std::vector<std::string> allowedPaths;
    mutable std::shared_mutex mutex;
};
