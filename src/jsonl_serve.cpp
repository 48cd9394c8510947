#include <drogon/drogon.h>
#include <json/json.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "JsonlController.hpp"

namespace {

std::unique_ptr<JsonlController> controller;

drogon::HttpResponsePtr jsonResponse(const Json::Value& body, bool failed) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    if (failed) {
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
    }
    return resp;
}

// POST /jsonl with the tool arguments as the body, e.g.
// {"operation": "slice", "handler": "/data/a.jsonl", "start": -10}
void handleJsonlRequest(const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        Json::Value resp(Json::objectValue);
        resp["error"]["code"] = "invalid_request";
        resp["error"]["message"] = json ? "Request body must be a JSON object" : "Invalid JSON";
        cb(jsonResponse(resp, true));
        return;
    }

    Json::Value params;
    params["name"] = "jsonl";
    params["arguments"] = *json;
    Json::Value result = controller->callTool(params);

    Json::Value response(Json::objectValue);
    if (result.isMember("__error__")) {
        const Json::Value& operation = (*json)["operation"];
        response["error"]["code"] = (operation.isString() ? operation.asString() : std::string("request")) + "_failed";
        response["error"]["message"] = result["__error__"];
        cb(jsonResponse(response, true));
        return;
    }
    result.removeMember("resourceListChanged");
    cb(jsonResponse(result, false));
}

// JSON-RPC 2.0 over POST /rpc, same methods as the stdio server.
void handleRpcRequest(const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    auto json = req->getJsonObject();
    if (!json) {
        cb(jsonResponse(controller->createError(Json::Value(), -32700, "Parse error"), true));
        return;
    }
    if (!json->isObject()) {
        cb(jsonResponse(controller->createError(Json::Value(), -32600, "Invalid Request"), true));
        return;
    }
    std::string method = (*json)["method"].asString();
    Json::Value id = (*json)["id"];
    if (method == "tools/list") {
        cb(jsonResponse(controller->createResponse(id, controller->listTools()), false));
    } else if (method == "resources/list") {
        cb(jsonResponse(controller->createResponse(id, controller->listResources()), false));
    } else if (method == "tools/call") {
        Json::Value result = controller->callTool((*json)["params"]);
        if (result.isMember("__error__")) {
            cb(jsonResponse(controller->createError(id, -32000, result["__error__"].asString()), false));
            return;
        }
        result.removeMember("resourceListChanged");
        cb(jsonResponse(controller->createResponse(id, result), false));
    } else {
        cb(jsonResponse(controller->createError(id, -32601, "Method not found: " + method), false));
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace drogon;
    uint16_t port = 8080;
    try {
        std::string configPath;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--port" && i + 1 < argc) {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else {
                std::cerr << "Usage: " << argv[0] << " [--port N] [--config server.json]" << std::endl;
                return 2;
            }
        }

        controller = std::make_unique<JsonlController>();
        if (!configPath.empty()) {
            std::ifstream in(configPath);
            Json::CharReaderBuilder builder;
            Json::Value config;
            std::string errs;
            if (!in || !Json::parseFromStream(builder, in, &config, &errs)) {
                spdlog::error("Cannot read config file {}: {}", configPath, errs);
                return 2;
            }
            controller->applyServerConfig(config);
        }
    } catch (const std::exception& e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }

    app().registerHandler("/jsonl", [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&callback) {
        handleJsonlRequest(req, std::move(callback));
    }, {Post});
    app().registerHandler("/rpc", [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&callback) {
        handleRpcRequest(req, std::move(callback));
    }, {Post});
    app().addListener("0.0.0.0", port);
    spdlog::info("Server starting on port {}", port);
    app().run();
    return 0;
}
