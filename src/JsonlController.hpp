#pragma once
#include <json/json.h>
#include <string>
#include <vector>
#include "CacheConfig.hpp"
#include "ReaderRegistry.hpp"

// JSON request dispatch shared by the stdio and HTTP front ends.
class JsonlController {
public:
    explicit JsonlController(CacheConfig defaults = CacheConfig::fromEnvironment());

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    Json::Value listTools() const;
    Json::Value listResources();

    // Runs one `jsonl` tool call. Failures come back as a result carrying
    // "__error__"; exceptions never escape.
    Json::Value callTool(const Json::Value& params);

    void setAllowedPaths(const std::vector<std::string>& paths);

    // Server config file object: { "allowed_paths": [...], "defaults": {...} }
    void applyServerConfig(const Json::Value& config);

private:
    Json::Value openReader(const Json::Value& arguments);
    Json::Value readLines(const std::string& operation, const Json::Value& arguments);

    ReaderRegistry registry_;
    CacheConfig defaults_;
};
