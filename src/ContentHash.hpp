#pragma once
#include <cstddef>
#include <string>

// Lowercase hex SHA-256 of a buffer.
std::string sha256Hex(const char* data, size_t size);

// Lowercase hex SHA-256 of a file's content, read in fixed-size chunks.
std::string sha256FileHex(const std::string& path);
