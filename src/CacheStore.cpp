#include "CacheStore.hpp"
#include "Errors.hpp"
#include "NamedLock.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

LoadResult CacheStore::load(const std::string& cachePath) {
    LoadResult result;
    std::ifstream in(cachePath, std::ios::binary);
    if (!in.is_open()) {
        result.status = fs::exists(cachePath) ? LoadStatus::Corrupt : LoadStatus::NotFound;
        if (result.status == LoadStatus::Corrupt) {
            result.error = "Cache file is not readable";
        }
        return result;
    }

    Json::CharReaderBuilder builder;
    Json::Value json;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &json, &errs)) {
        result.status = LoadStatus::Corrupt;
        result.error = "Cache is not valid JSON: " + errs;
        return result;
    }
    try {
        result.record = CacheRecord::fromJson(json);
        result.status = LoadStatus::Ok;
    } catch (const CacheCorruptError& e) {
        result.status = LoadStatus::Corrupt;
        result.error = e.what();
    }
    return result;
}

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    // Returns false if close(2) reported an error.
    bool reset() {
        int fd = fd_;
        fd_ = -1;
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int fd_;
};

std::string errnoMessage() {
    return std::strerror(errno);
}

void writeAll(int fd, const std::string& data, const fs::path& path) {
    const char* p = data.data();
    size_t remain = data.size();
    while (remain > 0) {
        ssize_t written = ::write(fd, p, remain);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Failed writing cache file " + path.string() + ": " + errnoMessage());
        }
        p += written;
        remain -= static_cast<size_t>(written);
    }
}

// Data first, then the rename: a crash leaves either the old cache or the
// complete new one.
void writeDurably(const fs::path& tmp, const std::string& data) {
    FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        throw std::runtime_error("Cannot open temporary cache file " + tmp.string() + ": " + errnoMessage());
    }
    writeAll(fd.get(), data, tmp);
    if (::fdatasync(fd.get()) != 0) {
        throw std::runtime_error("Failed to flush cache file " + tmp.string() + ": " + errnoMessage());
    }
    if (!fd.reset()) {
        throw std::runtime_error("Failed to close cache file " + tmp.string() + ": " + errnoMessage());
    }
}

void syncDirectory(const fs::path& dir) {
    FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid() || ::fsync(fd.get()) != 0) {
        spdlog::warn("Could not sync directory {}: {}", dir.string(), errnoMessage());
    }
}

} // namespace

void CacheStore::save(const std::string& cachePath, const CacheRecord& record) {
    fs::path target(cachePath);
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    fs::create_directories(dir);

    std::random_device rd;
    std::stringstream suffix;
    suffix << ".tmp." << ::getpid() << "." << std::hex << rd();
    fs::path tmp = target;
    tmp += suffix.str();

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    try {
        writeDurably(tmp, Json::writeString(writer, record.toJson()));
    } catch (const std::exception&) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Failed to move cache into place at " + cachePath + ": " + ec.message());
    }
    syncDirectory(dir);
}

bool CacheStore::isValid(const LoadResult& loaded, const std::string& sourcePath, const CacheConfig& config) {
    if (config.forceCache) {
        return false;
    }
    if (loaded.status != LoadStatus::Ok) {
        return false;
    }
    const Fingerprint& stored = loaded.record.fingerprint;
    if (config.checkCacheTime && fileModifiedTimeNs(sourcePath) != stored.modifiedTimeNs) {
        spdlog::info("Cache for {} is stale: modification time changed", sourcePath);
        return false;
    }
    if (config.checkCacheHash) {
        if (stored.contentHash.empty()) {
            spdlog::info("Cache for {} has no content hash to compare", sourcePath);
            return false;
        }
        if (computeContentHash(sourcePath) != stored.contentHash) {
            spdlog::info("Cache for {} is stale: content hash changed", sourcePath);
            return false;
        }
    }
    return true;
}

namespace {

void checkPaths(const std::string& sourcePath, const std::string& cachePath) {
    if (!fs::is_regular_file(sourcePath)) {
        throw SourceNotFoundError(sourcePath);
    }
    std::error_code ec;
    if (fs::exists(cachePath) && fs::equivalent(sourcePath, cachePath, ec)) {
        throw std::invalid_argument("The file path " + sourcePath + " and cache path " + cachePath +
                                    " resolve to the same location");
    }
}

void logLoadFailure(const LoadResult& loaded, const std::string& cachePath) {
    if (loaded.status == LoadStatus::Corrupt) {
        spdlog::warn("Discarding corrupt cache {}: {}", cachePath, loaded.error);
    }
}

CacheRecord buildAndSave(const std::string& sourcePath, const std::string& cachePath, const CacheConfig& config) {
    spdlog::info("Building line cache for {}", sourcePath);
    CacheRecord record = buildCacheRecord(sourcePath, config.checkCacheHash);
    CacheStore::save(cachePath, record);
    spdlog::debug("Saved {} line offsets to {}", record.lineCount(), cachePath);
    return record;
}

} // namespace

CacheRecord CacheStore::resolve(const std::string& sourcePath, const std::string& cachePath, const CacheConfig& config) {
    checkPaths(sourcePath, cachePath);

    if (!config.forceCache) {
        LoadResult loaded = load(cachePath);
        if (isValid(loaded, sourcePath, config)) {
            spdlog::debug("Cache hit for {} ({} lines)", sourcePath, loaded.record.lineCount());
            return std::move(loaded.record);
        }
        logLoadFailure(loaded, cachePath);
    }

    NamedLock lock(lockPathFor(cachePath));
    lock.acquire(std::chrono::milliseconds(config.lockTimeoutMs), config.lockRetries);

    if (!config.forceCache) {
        // another process may have rebuilt it while we waited
        LoadResult loaded = load(cachePath);
        if (isValid(loaded, sourcePath, config)) {
            spdlog::debug("Cache for {} was rebuilt concurrently", sourcePath);
            return std::move(loaded.record);
        }
    }
    return buildAndSave(sourcePath, cachePath, config);
}

CacheRecord CacheStore::rebuild(const std::string& sourcePath, const std::string& cachePath, const CacheConfig& config) {
    checkPaths(sourcePath, cachePath);
    NamedLock lock(lockPathFor(cachePath));
    lock.acquire(std::chrono::milliseconds(config.lockTimeoutMs), config.lockRetries);
    return buildAndSave(sourcePath, cachePath, config);
}
