#include "ContentHash.hpp"
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext newSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const char* data, size_t size) {
    if (size > 0 && EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    std::stringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (unsigned int)digest[i];
    }
    return ss.str();
}

} // namespace

std::string sha256Hex(const char* data, size_t size) {
    auto ctx = newSha256Context();
    update(ctx.get(), data, size);
    return finish(ctx.get());
}

std::string sha256FileHex(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for SHA-256 calculation: " + path);
    }
    auto ctx = newSha256Context();
    std::vector<char> buffer(8192);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        update(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing " + path);
    }
    return finish(ctx.get());
}
