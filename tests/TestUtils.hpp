#pragma once
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <unistd.h>

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

#define ASSERT_THROWS(expr, type) { \
    bool thrown_ = false; \
    try { expr; } catch (const type&) { thrown_ = true; } \
    if (!thrown_) { std::cerr << "Expected " << #type << " from " << #expr << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; } }

// Scratch directory removed on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void appendFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << content;
}

// "{\"i\":0}\n{\"i\":1}\n..." with `count` lines.
inline std::string numberedLines(int count, const std::string& key = "i") {
    std::string content;
    for (int i = 0; i < count; ++i) {
        content += "{\"" + key + "\":" + std::to_string(i) + "}\n";
    }
    return content;
}

inline std::string readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}
