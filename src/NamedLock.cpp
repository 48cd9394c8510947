#include "NamedLock.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace {

// Per-path mutexes shared by the NamedLocks alive for that path. An entry
// goes away with the last lock object that refers to it.
struct MutexRegistry {
    std::mutex mutex;
    std::unordered_map<std::string, std::weak_ptr<std::timed_mutex>> entries;
};

MutexRegistry& mutexRegistry() {
    static MutexRegistry registry;
    return registry;
}

std::shared_ptr<std::timed_mutex> threadMutexFor(const std::string& lockPath) {
    MutexRegistry& registry = mutexRegistry();
    std::lock_guard lock(registry.mutex);
    auto& entry = registry.entries[lockPath];
    auto mutex = entry.lock();
    if (!mutex) {
        mutex = std::make_shared<std::timed_mutex>();
        entry = mutex;
    }
    return mutex;
}

void dropThreadMutex(const std::string& lockPath, std::shared_ptr<std::timed_mutex>& mutex) {
    MutexRegistry& registry = mutexRegistry();
    std::lock_guard lock(registry.mutex);
    mutex.reset();
    auto it = registry.entries.find(lockPath);
    if (it != registry.entries.end() && it->second.expired()) {
        registry.entries.erase(it);
    }
}

std::string canonicalLockPath(const std::string& lockPath) {
    return std::filesystem::absolute(lockPath).lexically_normal().string();
}

} // namespace

NamedLock::NamedLock(const std::string& lockPath)
    : lockPath_(canonicalLockPath(lockPath)),
      threadMutex_(threadMutexFor(lockPath_)) {}

NamedLock::~NamedLock() {
    release();
    dropThreadMutex(lockPath_, threadMutex_);
}

size_t NamedLock::trackedPathCount() {
    MutexRegistry& registry = mutexRegistry();
    std::lock_guard lock(registry.mutex);
    return registry.entries.size();
}

bool NamedLock::tryAcquireFor(std::chrono::milliseconds timeout) {
    if (held_) {
        throw std::logic_error("NamedLock already held: " + lockPath_);
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    if (!threadMutex_->try_lock_until(deadline)) {
        return false;
    }

    try {
        if (!fileLock_) {
            std::filesystem::create_directories(std::filesystem::path(lockPath_).parent_path());
            // file_lock needs an existing file
            std::ofstream touch(lockPath_, std::ios::app);
            if (!touch) {
                throw std::runtime_error("Cannot create lock file " + lockPath_);
            }
            touch.close();
            fileLock_ = std::make_unique<boost::interprocess::file_lock>(lockPath_.c_str());
        }
        auto pause = std::chrono::milliseconds(1);
        while (!fileLock_->try_lock()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                fileLock_.reset();
                threadMutex_->unlock();
                return false;
            }
            std::this_thread::sleep_for(pause);
            pause = std::min(pause * 2, std::chrono::milliseconds(50));
        }
    } catch (...) {
        fileLock_.reset();
        threadMutex_->unlock();
        throw;
    }
    held_ = true;
    spdlog::debug("Acquired cache lock {}", lockPath_);
    return true;
}

void NamedLock::acquire(std::chrono::milliseconds timeout, int attempts) {
    attempts = std::max(attempts, 1);
    auto backoff = std::chrono::milliseconds(50);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (tryAcquireFor(timeout)) {
            return;
        }
        if (attempt < attempts) {
            spdlog::warn("Cache lock {} busy (attempt {}/{}), retrying in {} ms",
                         lockPath_, attempt, attempts, backoff.count());
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    spdlog::error("Giving up on cache lock {} after {} attempts", lockPath_, attempts);
    throw LockTimeoutError("Timed out waiting for cache lock " + lockPath_);
}

void NamedLock::release() {
    if (!held_) {
        return;
    }
    fileLock_->unlock();
    // fcntl locks belong to the process; closing any descriptor on the file
    // drops them, so close ours while the thread mutex still excludes others
    fileLock_.reset();
    threadMutex_->unlock();
    held_ = false;
    spdlog::debug("Released cache lock {}", lockPath_);
}
