#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "JsonlReader.hpp"

// Several JSONL files presented as one contiguous sequence of lines.
// Each file keeps its own reader and cache; a global index is mapped to
// (reader, local index) through prefix sums of the readers' line counts.
class JsonlMultiReader {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        Iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class JsonlMultiReader;
        Iterator(const JsonlMultiReader* owner, size_t reader);
        void skipExhausted();

        const JsonlMultiReader* owner_ = nullptr;
        size_t reader_ = 0;
        JsonlReader::Iterator current_;
    };

    // `cachePaths`, when given, must have one entry per path.
    JsonlMultiReader(const std::vector<std::string>& paths,
                     const CacheConfig& config = CacheConfig::fromEnvironment(),
                     const std::vector<std::optional<std::string>>& cachePaths = {});

    size_t length() const;

    std::string get(int64_t index);
    std::vector<std::string> slice(std::optional<int64_t> start,
                                   std::optional<int64_t> stop,
                                   int64_t step = 1);
    std::vector<std::string> getMany(const std::vector<int64_t>& indices);
    Json::Value getJson(int64_t index);

    Iterator begin() const;
    Iterator end() const;

    // Global index -> (reader index, local index); strict bounds.
    std::pair<size_t, size_t> locate(int64_t index) const;

    void recache();
    void recache(size_t readerIndex, std::optional<std::string> cachePath = std::nullopt);

    size_t readerCount() const { return readers_.size(); }
    JsonlReader& reader(size_t index) { return *readers_.at(index); }
    const JsonlReader& reader(size_t index) const { return *readers_.at(index); }

private:
    void refreshCounts();

    std::vector<std::unique_ptr<JsonlReader>> readers_;
    // cumulative_[i] = total lines in readers 0..i
    std::vector<size_t> cumulative_;
};
