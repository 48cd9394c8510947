#include "JsonlMultiReader.hpp"
#include "Errors.hpp"
#include "SliceIndices.hpp"
#include <algorithm>
#include <stdexcept>

JsonlMultiReader::JsonlMultiReader(const std::vector<std::string>& paths,
                                   const CacheConfig& config,
                                   const std::vector<std::optional<std::string>>& cachePaths) {
    if (!cachePaths.empty() && cachePaths.size() != paths.size()) {
        throw std::invalid_argument("Expected one cache path per file (" + std::to_string(paths.size()) +
                                    "), got " + std::to_string(cachePaths.size()));
    }
    if (config.cachePath && paths.size() > 1) {
        throw std::invalid_argument("A single cache path cannot be shared by several files; pass per-file cache paths");
    }
    readers_.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        CacheConfig fileConfig = config;
        if (!cachePaths.empty()) {
            fileConfig.cachePath = cachePaths[i];
        }
        readers_.push_back(std::make_unique<JsonlReader>(paths[i], fileConfig));
    }
    refreshCounts();
}

void JsonlMultiReader::refreshCounts() {
    cumulative_.clear();
    cumulative_.reserve(readers_.size());
    size_t total = 0;
    for (const auto& reader : readers_) {
        total += reader->length();
        cumulative_.push_back(total);
    }
}

size_t JsonlMultiReader::length() const {
    return cumulative_.empty() ? 0 : cumulative_.back();
}

std::pair<size_t, size_t> JsonlMultiReader::locate(int64_t index) const {
    size_t global = normalizeIndex(index, length());
    // first reader whose cumulative count exceeds the index; skips empty files
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), global);
    size_t reader = static_cast<size_t>(it - cumulative_.begin());
    size_t floor = reader == 0 ? 0 : cumulative_[reader - 1];
    return {reader, global - floor};
}

std::string JsonlMultiReader::get(int64_t index) {
    auto [reader, local] = locate(index);
    return readers_[reader]->get(static_cast<int64_t>(local));
}

std::vector<std::string> JsonlMultiReader::slice(std::optional<int64_t> start,
                                                 std::optional<int64_t> stop,
                                                 int64_t step) {
    std::vector<size_t> indices = resolveSlice(length(), start, stop, step);
    std::vector<std::string> lines;
    lines.reserve(indices.size());

    size_t pos = 0;
    while (pos < indices.size()) {
        auto [reader, local] = locate(static_cast<int64_t>(indices[pos]));
        size_t runEnd = pos + 1;
        while (runEnd < indices.size() && locate(static_cast<int64_t>(indices[runEnd])).first == reader) {
            ++runEnd;
        }

        // the run is itself a slice of that reader with the same step
        int64_t lastLocal = static_cast<int64_t>(local) + static_cast<int64_t>(runEnd - pos - 1) * step;
        int64_t localStop = lastLocal + step;
        std::optional<int64_t> stopBound;
        if (localStop >= 0) {
            stopBound = localStop;
        }
        auto part = readers_[reader]->slice(static_cast<int64_t>(local), stopBound, step);
        lines.insert(lines.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
        pos = runEnd;
    }
    return lines;
}

std::vector<std::string> JsonlMultiReader::getMany(const std::vector<int64_t>& indices) {
    std::vector<std::string> lines;
    lines.reserve(indices.size());
    for (int64_t index : indices) {
        lines.push_back(get(index));
    }
    return lines;
}

Json::Value JsonlMultiReader::getJson(int64_t index) {
    auto [reader, local] = locate(index);
    return readers_[reader]->getJson(static_cast<int64_t>(local));
}

void JsonlMultiReader::recache() {
    for (auto& reader : readers_) {
        reader->recache();
    }
    refreshCounts();
}

void JsonlMultiReader::recache(size_t readerIndex, std::optional<std::string> cachePath) {
    readers_.at(readerIndex)->recache(cachePath);
    refreshCounts();
}

JsonlMultiReader::Iterator JsonlMultiReader::begin() const {
    return Iterator(this, 0);
}

JsonlMultiReader::Iterator JsonlMultiReader::end() const {
    Iterator it;
    it.owner_ = this;
    it.reader_ = readers_.size();
    return it;
}

JsonlMultiReader::Iterator::Iterator(const JsonlMultiReader* owner, size_t reader)
    : owner_(owner), reader_(reader) {
    if (reader_ < owner_->readers_.size()) {
        current_ = owner_->readers_[reader_]->begin();
        skipExhausted();
    }
}

void JsonlMultiReader::Iterator::skipExhausted() {
    const auto& readers = owner_->readers_;
    while (reader_ < readers.size() && current_ == readers[reader_]->end()) {
        ++reader_;
        if (reader_ < readers.size()) {
            current_ = readers[reader_]->begin();
        }
    }
    if (reader_ == readers.size()) {
        current_ = JsonlReader::Iterator();
    }
}

JsonlMultiReader::Iterator& JsonlMultiReader::Iterator::operator++() {
    ++current_;
    skipExhausted();
    return *this;
}

bool JsonlMultiReader::Iterator::operator==(const Iterator& other) const {
    return owner_ == other.owner_ && reader_ == other.reader_ &&
           (owner_ == nullptr || reader_ == owner_->readers_.size() || current_ == other.current_);
}
