#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "CacheConfig.hpp"
#include "Precache.hpp"

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --files a.jsonl,b.jsonl [options]\n"
              << "  -f, --files LIST     comma-separated files to cache (required)\n"
              << "  -t, --threads N      worker threads, 1 disables threading (default 1)\n"
              << "  -v, --verbose        print progress\n"
              << "      --force          always rebuild\n"
              << "      --check-time     rebuild when the modification time changed\n"
              << "      --check-hash     rebuild when the content hash changed\n"
              << "      --dir-method M   user|local cache location\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string fileList;
    size_t threads = 1;
    bool verbose = false;
    CacheConfig config;

    try {
        config = CacheConfig::fromEnvironment();
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };
            if (arg == "-f" || arg == "--files") {
                fileList = value();
            } else if (arg == "-t" || arg == "--threads") {
                int n = std::stoi(value());
                if (n < 1) {
                    throw std::invalid_argument("--threads must be at least 1");
                }
                threads = static_cast<size_t>(n);
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "--force") {
                config.forceCache = true;
            } else if (arg == "--check-time") {
                config.checkCacheTime = true;
            } else if (arg == "--check-hash") {
                config.checkCacheHash = true;
            } else if (arg == "--dir-method") {
                config.location = parseCacheLocation(value());
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    std::vector<std::string> files = splitFileList(fileList);
    if (files.empty()) {
        std::cerr << "Error: --files is required" << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    auto progress = [verbose](size_t done, size_t total, const PrecacheResult& result) {
        if (verbose) {
            std::cout << formatPrecacheMessage(done, total, result) << std::endl;
        }
    };
    std::vector<PrecacheResult> results;
    try {
        results = precacheFiles(files, threads, config, progress);
    } catch (const std::exception& e) {
        spdlog::error("Precaching aborted: {}", e.what());
        return 1;
    }

    int status = 0;
    for (const auto& result : results) {
        if (!result.ok) {
            if (!verbose) {
                std::cerr << result.path << ": " << result.error << std::endl;
            }
            status = 1;
        }
    }
    return status;
}
