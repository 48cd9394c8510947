#include "MappedFile.hpp"
#include <filesystem>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

MappedFile::MappedFile(const std::string& path)
    : mappedSize(0) {
    // mapped_region rejects empty files
    if (std::filesystem::file_size(path) == 0) {
        return;
    }
    boost::interprocess::file_mapping mapping(path.c_str(), boost::interprocess::read_only);
    boost::interprocess::mapped_region mapped(mapping, boost::interprocess::read_only);
    mapped.advise(boost::interprocess::mapped_region::advice_sequential);
    fileMapping.swap(mapping);
    region.swap(mapped);
    mappedSize = region.get_size();
}

size_t MappedFile::size() const {
    return mappedSize;
}

const char* MappedFile::data() const {
    if (mappedSize == 0) {
        return nullptr;
    }
    return static_cast<const char*>(region.get_address());
}
