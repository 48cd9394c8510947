#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Line-start byte offsets of a buffer, split on '\n' only. A terminator at the
// very end does not open an extra empty line; an unterminated last line still
// counts. Empty input yields no offsets.
std::vector<uint64_t> scanLineOffsets(const char* data, size_t size);

// Maps the file at `path` and scans it. Throws SourceNotFoundError if missing.
std::vector<uint64_t> scanFileOffsets(const std::string& path);
