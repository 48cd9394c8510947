#include "OffsetScanner.hpp"
#include "Errors.hpp"
#include "MappedFile.hpp"
#include <cstring>
#include <filesystem>

std::vector<uint64_t> scanLineOffsets(const char* data, size_t size) {
    std::vector<uint64_t> offsets;
    if (size == 0) {
        return offsets;
    }
    offsets.push_back(0);

    const char* pos = data;
    const char* end = data + size;
    while (pos < end) {
        const void* hit = std::memchr(pos, '\n', static_cast<size_t>(end - pos));
        if (!hit) {
            break;
        }
        pos = static_cast<const char*>(hit) + 1;
        // trailing terminator: no empty line after it
        if (pos < end) {
            offsets.push_back(static_cast<uint64_t>(pos - data));
        }
    }
    return offsets;
}

std::vector<uint64_t> scanFileOffsets(const std::string& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw SourceNotFoundError(path);
    }
    MappedFile file(path);
    return scanLineOffsets(file.data(), file.size());
}
