#pragma once
#include <stdexcept>
#include <string>

// Target data file is missing at construction or recache time.
class SourceNotFoundError : public std::runtime_error {
public:
    explicit SourceNotFoundError(const std::string& path)
        : std::runtime_error("No file found at specified file path \"" + path + "\""), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Persisted cache is unreadable or fails structural/version validation.
class CacheCorruptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IndexOutOfRangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Build lock could not be taken within the configured attempts.
class LockTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
