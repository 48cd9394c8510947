#include "JsonlController.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>

JsonlController::JsonlController(CacheConfig defaults)
    : defaults_(std::move(defaults)) {
}

Json::Value JsonlController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value JsonlController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value JsonlController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value tool;
    tool["name"] = "jsonl";
    tool["description"] = "Indexed access to line-delimited JSON files through a persisted line offset cache";
    tool["inputSchema"]["type"] = "object";

    Json::Value& props = tool["inputSchema"]["properties"];
    props["operation"]["type"] = "string";
    props["operation"]["description"] = "Operation to perform";
    for (const char* op : {"open", "length", "get", "slice", "recache", "close"}) {
        props["operation"]["enum"].append(op);
    }

    props["path"]["type"] = "string";
    props["path"]["description"] = "JSONL file to open (required for 'open')";

    props["handler"]["type"] = "string";
    props["handler"]["description"] = "Handler returned by 'open' (required for every other operation)";

    props["options"]["type"] = "object";
    props["options"]["description"] = "Cache options for 'open': force_cache, check_cache_time, check_cache_hash, cache_path";

    props["index"]["type"] = "integer";
    props["index"]["description"] = "Line index for 'get'; negative values count from the end";

    props["indices"]["type"] = "array";
    props["indices"]["items"]["type"] = "integer";
    props["indices"]["description"] = "Several line indices for 'get' (alternative to 'index')";

    props["start"]["type"] = "integer";
    props["stop"]["type"] = "integer";
    props["step"]["type"] = "integer";
    props["step"]["default"] = 1;
    props["start"]["description"] = "Slice start for 'slice' (optional, may be negative)";
    props["stop"]["description"] = "Slice stop for 'slice' (optional, exclusive, may be negative)";
    props["step"]["description"] = "Slice step for 'slice'; negative values reverse the order";

    props["decode"]["type"] = "boolean";
    props["decode"]["default"] = false;
    props["decode"]["description"] = "Return parsed JSON values instead of raw line text";

    props["cache_path"]["type"] = "string";
    props["cache_path"]["description"] = "New cache location for 'recache' (optional)";

    tool["inputSchema"]["required"].append("operation");

    tools.append(tool);
    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value JsonlController::listResources() {
    Json::Value resources(Json::arrayValue);
    for (const auto& handler : registry_.listHandlers()) {
        try {
            size_t lines = registry_.withReader(handler, [](JsonlReader& reader) { return reader.length(); });
            Json::Value resource;
            resource["uri"] = "file://" + handler;
            resource["name"] = std::filesystem::path(handler).filename().string();
            resource["description"] = "JSONL file (" + std::to_string(lines) + " lines)";
            resource["mimeType"] = "application/jsonl";
            resources.append(resource);
        } catch (const std::runtime_error&) {
            // closed between listing and lookup
        }
    }
    Json::Value result;
    result["resources"] = resources;
    return result;
}

namespace {

std::optional<int64_t> optionalInt(const Json::Value& arguments, const char* key) {
    if (!arguments.isMember(key) || arguments[key].isNull()) {
        return std::nullopt;
    }
    if (!arguments[key].isInt64()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an integer");
    }
    return arguments[key].asInt64();
}

Json::Value lineItem(std::string line, bool decode) {
    Json::Value item;
    if (decode) {
        item["type"] = "json";
        item["json"] = parseJsonLine(line);
    } else {
        item["type"] = "text";
        item["text"] = std::move(line);
    }
    return item;
}

Json::Value textContent(const std::string& text) {
    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = text;
    return result;
}

} // namespace

Json::Value JsonlController::openReader(const Json::Value& arguments) {
    std::string path = arguments["path"].asString();
    if (path.empty()) {
        throw std::invalid_argument("'path' is required for 'open'");
    }
    CacheConfig config = CacheConfig::fromJson(arguments.get("options", Json::Value()), defaults_);
    std::string handler = registry_.open(path, config);
    size_t lines = registry_.withReader(handler, [](JsonlReader& reader) { return reader.length(); });

    Json::Value result = textContent("File opened.\n\nHandler: " + handler + "\nLines: " + std::to_string(lines));
    result["handler"] = handler;
    result["lines"] = (Json::Value::UInt64)lines;
    result["resourceListChanged"] = true;
    return result;
}

Json::Value JsonlController::readLines(const std::string& operation, const Json::Value& arguments) {
    std::string handler = arguments["handler"].asString();
    bool decode = arguments.get("decode", false).asBool();

    return registry_.withReader(handler, [&](JsonlReader& reader) {
        Json::Value content(Json::arrayValue);
        if (operation == "get" && arguments.isMember("indices")) {
            if (!arguments["indices"].isArray()) {
                throw std::invalid_argument("'indices' must be an array of integers");
            }
            for (const auto& value : arguments["indices"]) {
                if (!value.isInt64()) {
                    throw std::invalid_argument("'indices' must be an array of integers");
                }
                int64_t index = value.asInt64();
                content.append(lineItem(reader.get(index), decode));
            }
        } else if (operation == "get") {
            auto index = optionalInt(arguments, "index");
            if (!index) {
                throw std::invalid_argument("'index' is required for 'get'");
            }
            content.append(lineItem(reader.get(*index), decode));
        } else {
            int64_t step = optionalInt(arguments, "step").value_or(1);
            auto lines = reader.slice(optionalInt(arguments, "start"), optionalInt(arguments, "stop"), step);
            for (auto& line : lines) {
                content.append(lineItem(std::move(line), decode));
            }
        }
        Json::Value result;
        result["content"] = content;
        return result;
    });
}

Json::Value JsonlController::callTool(const Json::Value& params) {
    Json::Value result;
    if (!params.isObject()) {
        result["__error__"] = "Error: tool call params must be a JSON object";
        return result;
    }
    try {
        std::string toolName = params["name"].asString();
        const Json::Value& arguments = params["arguments"];
        if (toolName != "jsonl") {
            result["__error__"] = std::string("Unknown tool: ") + toolName;
            return result;
        }
        if (!arguments.isObject()) {
            result["__error__"] = "Error: 'arguments' must be a JSON object";
            return result;
        }

        std::string operation = arguments["operation"].asString();
        if (operation == "open") {
            return openReader(arguments);
        } else if (operation == "get" || operation == "slice") {
            return readLines(operation, arguments);
        } else if (operation == "length") {
            std::string handler = arguments["handler"].asString();
            size_t lines = registry_.withReader(handler, [](JsonlReader& reader) { return reader.length(); });
            result = textContent(std::to_string(lines));
            result["lines"] = (Json::Value::UInt64)lines;
            return result;
        } else if (operation == "recache") {
            std::string handler = arguments["handler"].asString();
            std::optional<std::string> cachePath;
            if (arguments.isMember("cache_path") && !arguments["cache_path"].isNull()) {
                cachePath = arguments["cache_path"].asString();
            }
            size_t lines = registry_.withReader(handler, [&](JsonlReader& reader) {
                reader.recache(cachePath);
                return reader.length();
            });
            result = textContent("Recached " + handler + " (" + std::to_string(lines) + " lines)");
            result["lines"] = (Json::Value::UInt64)lines;
            result["resourceListChanged"] = true;
            return result;
        } else if (operation == "close") {
            std::string handler = arguments["handler"].asString();
            if (!registry_.close(handler)) {
                result["__error__"] = std::string("Invalid handler: ") + handler;
                return result;
            }
            result = textContent(std::string("Handler closed successfully: ") + handler);
            result["resourceListChanged"] = true;
            return result;
        } else {
            result["__error__"] = std::string("Unknown operation: ") + operation;
            return result;
        }
    } catch (const std::exception& e) {
        result = Json::Value();
        result["__error__"] = std::string("Error: ") + e.what();
        return result;
    }
}

void JsonlController::setAllowedPaths(const std::vector<std::string>& paths) {
    registry_.setAllowedPaths(paths);
}

void JsonlController::applyServerConfig(const Json::Value& config) {
    if (!config.isObject()) {
        throw std::invalid_argument("Server config must be a JSON object");
    }
    if (config.isMember("allowed_paths")) {
        std::vector<std::string> paths;
        for (const auto& path : config["allowed_paths"]) {
            paths.push_back(path.asString());
        }
        setAllowedPaths(paths);
    }
    if (config.isMember("defaults")) {
        defaults_ = CacheConfig::fromJson(config["defaults"], defaults_);
    }
}
