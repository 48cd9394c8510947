#pragma once
#include <string>
#include <cstddef>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of a whole file. A zero-length file is not mapped;
// data() is then nullptr and size() is 0.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    size_t size() const;
    const char* data() const;

private:
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t mappedSize;
};
