#include "CachePaths.hpp"
#include "ContentHash.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

CacheLocation parseCacheLocation(const std::string& name) {
    if (name == "user") {
        return CacheLocation::User;
    }
    if (name == "local") {
        return CacheLocation::Local;
    }
    throw std::invalid_argument("Unknown cache directory method: \"" + name + "\" (expected \"user\" or \"local\")");
}

std::string shortPathHash(const std::string& text) {
    return sha256Hex(text.data(), text.size()).substr(0, 16);
}

std::string defaultCachePath(const std::string& sourcePath, CacheLocation location, const std::string& dataDir) {
    fs::path source = fs::absolute(sourcePath).lexically_normal();
    if (location == CacheLocation::Local) {
        fs::path dir = source.parent_path() / ".jsonl_cache" / source.stem();
        return (dir / (shortPathHash(source.filename().string()) + kCacheExtension)).string();
    }

    std::string posix = source.generic_string();
    std::string name;
    name.reserve(posix.size() + 8);
    for (char c : posix) {
        if (c == '/') {
            name += "--";
        } else {
            name += c;
        }
    }
    fs::path dir = fs::path(dataDir) / "jsonl_cache" / name;
    return (dir / (shortPathHash(posix) + kCacheExtension)).string();
}

std::string lockPathFor(const std::string& cachePath) {
    fs::path cache(cachePath);
    return (cache.parent_path() / ".locks" / (cache.filename().string() + ".lock")).string();
}

std::string defaultDataDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return xdg;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".local" / "share").string();
    }
    return fs::temp_directory_path().string();
}
