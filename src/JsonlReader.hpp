#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "CacheConfig.hpp"
#include "CacheRecord.hpp"

// Parses one line as JSON with jsoncpp; throws std::runtime_error carrying
// the parser's message when it is malformed.
Json::Value parseJsonLine(const std::string& line);

// Random, sliced and sequential line access over one JSONL file, backed by a
// persisted table of line offsets.
//
// Lines are returned as raw bytes without the trailing '\n'; decoding is left
// to the caller (getJson is a convenience over jsoncpp).
//
// A reader owns one file handle and is not safe for concurrent use; give each
// thread its own reader.
class JsonlReader {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        Iterator() = default;

        reference operator*() const { return line_; }
        pointer operator->() const { return &line_; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const { return index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return index_ != other.index_; }

    private:
        friend class JsonlReader;
        Iterator(const std::string& path, size_t count);
        void readCurrent();

        std::shared_ptr<std::ifstream> stream_;
        size_t index_ = 0;
        size_t count_ = 0;
        std::string line_;
    };

    // Throws SourceNotFoundError if `sourcePath` does not exist.
    explicit JsonlReader(const std::string& sourcePath, const CacheConfig& config = CacheConfig::fromEnvironment());

    size_t length() const { return record_.lineCount(); }

    // Strict: throws IndexOutOfRangeError outside [-length, length-1].
    std::string get(int64_t index);

    // Lenient list-style slice; bounds are clamped, step may be negative.
    std::vector<std::string> slice(std::optional<int64_t> start,
                                   std::optional<int64_t> stop,
                                   int64_t step = 1);

    std::vector<std::string> getMany(const std::vector<int64_t>& indices);

    // Parses line `index` as JSON; throws std::runtime_error if malformed.
    Json::Value getJson(int64_t index);

    // Each call starts a fresh sequential pass from line 0, reading through
    // its own file handle.
    Iterator begin() const;
    Iterator end() const;

    // Rebuilds the offsets unconditionally, optionally moving the cache.
    void recache(std::optional<std::string> cachePath = std::nullopt);

    // Re-resolves the cache under `config`: its flags decide whether the
    // current cache is kept or rebuilt, and its cache path (if any) replaces
    // the current one.
    void reload(const CacheConfig& config);

    const std::string& sourcePath() const { return sourcePath_; }
    const std::string& cachePath() const { return cachePath_; }
    const CacheRecord& record() const { return record_; }
    const CacheConfig& config() const { return config_; }

private:
    std::string readLine(size_t index);
    std::vector<std::string> readRun(size_t first, size_t last);
    void reopen();

    std::string sourcePath_;
    std::string cachePath_;
    CacheConfig config_;
    CacheRecord record_;
    std::ifstream file_;
};
