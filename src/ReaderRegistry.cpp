#include "ReaderRegistry.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <algorithm>

void ReaderRegistry::setAllowedPaths(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex);
    allowedPaths.clear();
    for (const auto& path : paths) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(path, ec);
        if (!ec) {
            allowedPaths.push_back(canonical.string());
        }
    }
}

bool ReaderRegistry::isPathAllowed(const std::string& path) const {
    if (allowedPaths.empty()) {
        return true;
    }

    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec).string();
    if (ec) {
        return false;
    }
    for (const auto& allowed : allowedPaths) {
        if (canonical == allowed ||
            canonical.compare(0, allowed.length() + 1, allowed + "/") == 0) {
            return true;
        }
    }
    return false;
}

namespace {

// Options that ask for more than trusting the cache already in use.
bool wantsRevalidation(const CacheConfig& config) {
    return config.forceCache || config.checkCacheTime || config.checkCacheHash || config.cachePath.has_value();
}

} // namespace

std::string ReaderRegistry::open(const std::string& path, const CacheConfig& config) {
    if (!std::filesystem::exists(path)) {
        throw SourceNotFoundError(path);
    }
    auto handler = std::filesystem::canonical(path).string();

    std::shared_ptr<Entry> existing;
    {
        std::unique_lock lock(mutex);
        if (!isPathAllowed(handler)) {
            throw std::runtime_error("Access denied: path not in allowed list");
        }
        auto it = entries.find(handler);
        if (it != entries.end()) {
            // counted now so a concurrent close cannot drop the entry
            existing = it->second;
            existing->refcount++;
        }
    }

    if (existing) {
        if (wantsRevalidation(config)) {
            try {
                std::lock_guard entryLock(existing->mutex);
                existing->reader->reload(config);
            } catch (const std::exception&) {
                close(handler);
                throw;
            }
        }
        return handler;
    }

    // cache builds and lock waits happen outside the registry lock
    auto entry = std::make_shared<Entry>();
    entry->reader = std::make_unique<JsonlReader>(handler, config);

    std::unique_lock lock(mutex);
    auto [it, inserted] = entries.emplace(handler, entry);
    if (!inserted) {
        // opened concurrently; share the reader that won
        it->second->refcount++;
    }
    return handler;
}

std::shared_ptr<ReaderRegistry::Entry> ReaderRegistry::find(const std::string& handler) const {
    std::shared_lock lock(mutex);
    auto it = entries.find(handler);
    if (it == entries.end()) {
        return nullptr;
    }
    return it->second;
}

bool ReaderRegistry::close(const std::string& handler) {
    std::unique_lock lock(mutex);
    auto it = entries.find(handler);
    if (it == entries.end()) {
        return false;
    }
    if (--it->second->refcount <= 0) {
        entries.erase(it);
    }
    return true;
}

std::vector<std::string> ReaderRegistry::listHandlers() const {
    std::shared_lock lock(mutex);
    std::vector<std::string> handlers;
    handlers.reserve(entries.size());
    for (const auto& [handler, entry] : entries) {
        handlers.push_back(handler);
    }
    std::sort(handlers.begin(), handlers.end());
    return handlers;
}
