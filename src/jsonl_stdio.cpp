#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>
#include "JsonlController.hpp"

namespace {

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // one message per line
    std::cout << Json::writeString(writer, message) << std::endl;
}

void handleInitialize(JsonlController& controller, const Json::Value& id) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = true;
    result["serverInfo"]["name"] = "jsonl-cache";
    result["serverInfo"]["version"] = "1.0.0";
    writeMessage(controller.createResponse(id, result));
}

void sendResourceListChanged() {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = "notifications/resources/list_changed";
    writeMessage(notification);
}

void handleCallTool(JsonlController& controller, const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller.callTool(params);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    bool changed = result.get("resourceListChanged", false).asBool();
    result.removeMember("resourceListChanged");
    writeMessage(controller.createResponse(id, result));
    if (changed) {
        sendResourceListChanged();
    }
}

void processRequest(JsonlController& controller, const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        spdlog::error("JSON parse error: {}", errs);
        writeMessage(controller.createError(Json::Value(), -32700, "Parse error"));
        return;
    }

    if (!request.isObject()) {
        writeMessage(controller.createError(Json::Value(), -32600, "Invalid Request"));
        return;
    }

    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];

    if (method == "initialize") {
        handleInitialize(controller, id);
    } else if (method == "tools/list") {
        writeMessage(controller.createResponse(id, controller.listTools()));
    } else if (method == "tools/call") {
        handleCallTool(controller, id, params);
    } else if (method == "resources/list") {
        writeMessage(controller.createResponse(id, controller.listResources()));
    } else if (method == "notifications/initialized") {
        // No response needed for notifications
    } else {
        writeMessage(controller.createError(id, -32601, "Method not found: " + method));
    }
}

bool loadServerConfig(JsonlController& controller, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open config file {}", path);
        return false;
    }
    Json::CharReaderBuilder builder;
    Json::Value config;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &config, &errs)) {
        spdlog::error("Invalid config file {}: {}", path, errs);
        return false;
    }
    try {
        controller.applyServerConfig(config);
    } catch (const std::exception& e) {
        spdlog::error("Invalid config file {}: {}", path, e.what());
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries the protocol; diagnostics go to stderr
    spdlog::set_default_logger(spdlog::stderr_logger_mt("jsonl_stdio"));

    try {
        JsonlController controller;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                if (!loadServerConfig(controller, argv[++i])) {
                    return 2;
                }
            } else if (arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else {
                std::cerr << "Usage: " << argv[0] << " [--config server.json] [--verbose]" << std::endl;
                return 2;
            }
        }

        std::string line;
        spdlog::info("jsonl stdio server started");
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            try {
                processRequest(controller, line);
            } catch (const std::exception& e) {
                // one bad request must not take the session down
                spdlog::error("Request failed: {}", e.what());
                writeMessage(controller.createError(Json::Value(), -32603, std::string("Internal error: ") + e.what()));
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
