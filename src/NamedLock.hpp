#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <boost/interprocess/sync/file_lock.hpp>

// Mutual exclusion scoped to one lock path, across threads of this process
// (timed mutex keyed by path) and across processes (advisory file lock).
// Locks on different paths never interact. Not re-entrant.
class NamedLock {
public:
    explicit NamedLock(const std::string& lockPath);
    ~NamedLock();

    NamedLock(const NamedLock&) = delete;
    NamedLock& operator=(const NamedLock&) = delete;

    // One bounded attempt. Returns false if the lock is still held elsewhere
    // when `timeout` expires.
    bool tryAcquireFor(std::chrono::milliseconds timeout);

    // Up to `attempts` bounded attempts with exponential backoff between them;
    // throws LockTimeoutError when all of them fail.
    void acquire(std::chrono::milliseconds timeout, int attempts);

    void release();
    bool held() const { return held_; }
    const std::string& path() const { return lockPath_; }

    // Lock paths with at least one live NamedLock in this process.
    static size_t trackedPathCount();

private:
    std::string lockPath_;
    std::shared_ptr<std::timed_mutex> threadMutex_;
    std::unique_ptr<boost::interprocess::file_lock> fileLock_;
    bool held_ = false;
};
