#include "JsonlReader.hpp"
#include "CacheStore.hpp"
#include "Errors.hpp"
#include "SliceIndices.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {

std::runtime_error staleCacheError(const std::string& path, size_t index) {
    return std::runtime_error("Failed to read line " + std::to_string(index) + " of " + path +
                              ": the cache lists more lines than the file holds; recache the file");
}

void stripTerminator(std::string& line) {
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
}

} // namespace

JsonlReader::JsonlReader(const std::string& sourcePath, const CacheConfig& config)
    : config_(config) {
    if (!std::filesystem::is_regular_file(sourcePath)) {
        throw SourceNotFoundError(sourcePath);
    }
    sourcePath_ = std::filesystem::absolute(sourcePath).lexically_normal().string();
    cachePath_ = config_.resolveCachePath(sourcePath_);
    record_ = CacheStore::resolve(sourcePath_, cachePath_, config_);
    reopen();
    spdlog::debug("Opened {} ({} lines, cache {})", sourcePath_, record_.lineCount(), cachePath_);
}

void JsonlReader::reopen() {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    file_.open(sourcePath_, std::ios::binary);
    if (!file_.is_open()) {
        if (!std::filesystem::exists(sourcePath_)) {
            throw SourceNotFoundError(sourcePath_);
        }
        throw std::runtime_error("Cannot open " + sourcePath_ + " for reading");
    }
}

std::string JsonlReader::readLine(size_t index) {
    const auto& offsets = record_.offsets;
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offsets[index]));

    std::string line;
    if (index + 1 < offsets.size()) {
        const size_t len = static_cast<size_t>(offsets[index + 1] - offsets[index]);
        line.resize(len);
        file_.read(&line[0], static_cast<std::streamsize>(len));
        if (static_cast<size_t>(file_.gcount()) != len) {
            throw staleCacheError(sourcePath_, index);
        }
        stripTerminator(line);
    } else if (!std::getline(file_, line)) {
        throw staleCacheError(sourcePath_, index);
    }
    return line;
}

// Lines [first, last] read as one sequential block where possible.
std::vector<std::string> JsonlReader::readRun(size_t first, size_t last) {
    const auto& offsets = record_.offsets;
    std::vector<std::string> lines;
    lines.reserve(last - first + 1);

    // the final line has no cached end offset
    const size_t tail = (last + 1 == offsets.size()) ? last : last + 1;
    if (tail > first) {
        const uint64_t base = offsets[first];
        const size_t len = static_cast<size_t>(offsets[tail] - base);
        std::string block(len, '\0');
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(base));
        file_.read(&block[0], static_cast<std::streamsize>(len));
        if (static_cast<size_t>(file_.gcount()) != len) {
            throw staleCacheError(sourcePath_, tail - 1);
        }
        for (size_t i = first; i < tail; ++i) {
            std::string line = block.substr(offsets[i] - base, offsets[i + 1] - offsets[i]);
            stripTerminator(line);
            lines.push_back(std::move(line));
        }
    }
    if (tail == last) {
        lines.push_back(readLine(last));
    }
    return lines;
}

std::string JsonlReader::get(int64_t index) {
    return readLine(normalizeIndex(index, length()));
}

std::vector<std::string> JsonlReader::slice(std::optional<int64_t> start,
                                            std::optional<int64_t> stop,
                                            int64_t step) {
    std::vector<size_t> indices = resolveSlice(length(), start, stop, step);
    if (step == 1 && !indices.empty()) {
        return readRun(indices.front(), indices.back());
    }
    std::vector<std::string> lines;
    lines.reserve(indices.size());
    for (size_t index : indices) {
        lines.push_back(readLine(index));
    }
    return lines;
}

std::vector<std::string> JsonlReader::getMany(const std::vector<int64_t>& indices) {
    std::vector<std::string> lines;
    lines.reserve(indices.size());
    for (int64_t index : indices) {
        lines.push_back(get(index));
    }
    return lines;
}

Json::Value parseJsonLine(const std::string& line) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &value, &errs)) {
        throw std::runtime_error("malformed JSON: " + errs);
    }
    return value;
}

Json::Value JsonlReader::getJson(int64_t index) {
    std::string line = get(index);
    try {
        return parseJsonLine(line);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("JSONL data at line " + std::to_string(index) + " of " + sourcePath_ +
                                 " could not be parsed: " + e.what());
    }
}

void JsonlReader::recache(std::optional<std::string> cachePath) {
    if (cachePath) {
        cachePath_ = *cachePath;
        config_.cachePath = *cachePath;
    }
    record_ = CacheStore::rebuild(sourcePath_, cachePath_, config_);
    reopen();
}

void JsonlReader::reload(const CacheConfig& config) {
    CacheConfig next = config;
    std::string nextCachePath = next.cachePath ? *next.cachePath : cachePath_;
    record_ = CacheStore::resolve(sourcePath_, nextCachePath, next);
    config_ = std::move(next);
    cachePath_ = std::move(nextCachePath);
    reopen();
}

JsonlReader::Iterator JsonlReader::begin() const {
    return Iterator(sourcePath_, length());
}

JsonlReader::Iterator JsonlReader::end() const {
    Iterator it;
    it.index_ = length();
    it.count_ = length();
    return it;
}

JsonlReader::Iterator::Iterator(const std::string& path, size_t count)
    : stream_(std::make_shared<std::ifstream>(path, std::ios::binary)),
      index_(0),
      count_(count) {
    if (!stream_->is_open()) {
        throw std::runtime_error("Cannot open " + path + " for iteration");
    }
    readCurrent();
}

void JsonlReader::Iterator::readCurrent() {
    if (index_ >= count_) {
        line_.clear();
        return;
    }
    if (!std::getline(*stream_, line_)) {
        throw std::runtime_error("Unexpected end of file at line " + std::to_string(index_) +
                                 ": the cache lists more lines than the file holds");
    }
}

JsonlReader::Iterator& JsonlReader::Iterator::operator++() {
    ++index_;
    readCurrent();
    return *this;
}
