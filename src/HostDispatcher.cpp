#include "HostDispatcher.hpp"
#include <sstream>
#include <trantor/utils/Logger.h>

HostDispatcher::HostDispatcher(FileIngestController& files, ServiceLifecycleManager& service, EventBroadcaster& events,
                               Writer writer, std::size_t defaultChunkSize)
    : files_(files), service_(service), events_(events), writer_(std::move(writer)),
      defaultChunkSize_(defaultChunkSize) {
}

Json::Value HostDispatcher::createResponse(const Json::Value& id, const Json::Value& result) {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value HostDispatcher::createError(const Json::Value& id, int code, const std::string& message) {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value HostDispatcher::createNotification(const std::string& method, const Json::Value& params) {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    return notification;
}

void HostDispatcher::processRequest(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs) || !request.isObject()) {
        LOG_WARN << "JSON parse error: " << errs;
        writer_(createError(Json::Value::null, -32700, "Parse error"));
        return;
    }
    try {
        handleRequest(request);
    } catch (const std::exception& e) {
        LOG_ERROR << "Request failed: " << e.what();
        writer_(createError(request["id"], -32603, std::string("Internal error: ") + e.what()));
    }
}

void HostDispatcher::handleRequest(const Json::Value& request) {
    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];
    LOG_DEBUG << "Request " << method;

    if (method == "read-file") {
        handleReadFile(id, params);
    } else if (method == "read-file-stream") {
        handleReadFileStream(id, params);
    } else if (method == "get-file-info") {
        handleGetFileInfo(id, params);
    } else if (method == "mcp-server-start") {
        handleServiceStart(id);
    } else if (method == "mcp-server-stop") {
        handleServiceStop(id);
    } else if (method == "mcp-server-status") {
        handleServiceStatus(id);
    } else if (!request.isMember("id")) {
        // Unknown notifications need no response
    } else {
        writer_(createError(id, -32601, "Method not found: " + method));
    }
}

bool HostDispatcher::requirePath(const Json::Value& id, const Json::Value& params, std::string& path) {
    if (!params.isObject() || !params["path"].isString() || params["path"].asString().empty()) {
        writer_(createError(id, -32602, "Invalid params: 'path' must be a non-empty string"));
        return false;
    }
    path = params["path"].asString();
    return true;
}

void HostDispatcher::handleReadFile(const Json::Value& id, const Json::Value& params) {
    std::string path;
    if (!requirePath(id, params, path)) return;
    writer_(createResponse(id, files_.readFile(path)));
}

void HostDispatcher::handleGetFileInfo(const Json::Value& id, const Json::Value& params) {
    std::string path;
    if (!requirePath(id, params, path)) return;
    writer_(createResponse(id, files_.getFileInfo(path)));
}

void HostDispatcher::handleReadFileStream(const Json::Value& id, const Json::Value& params) {
    std::string path;
    if (!requirePath(id, params, path)) return;

    std::size_t chunkSize = defaultChunkSize_;
    if (params.isMember("chunkSize") && !params["chunkSize"].isNull()) {
        const Json::Value& value = params["chunkSize"];
        if (!value.isUInt64() || value.asUInt64() < 1) {
            writer_(createError(id, -32602, "Invalid params: 'chunkSize' must be a positive integer"));
            return;
        }
        chunkSize = static_cast<std::size_t>(value.asUInt64());
    }

    EventBroadcaster* events = &events_;
    Writer writer = writer_;
    files_.streamFile(path, chunkSize,
        [events, id](const std::string& channel, const Json::Value& payload) {
            Json::Value tagged = payload;
            tagged["requestId"] = id;
            events->broadcast(channel, tagged);
        },
        [writer, id](const Json::Value& result) {
            writer(createResponse(id, result));
        });
}

void HostDispatcher::handleServiceStart(const Json::Value& id) {
    Writer writer = writer_;
    service_.start([writer, id](const LifecycleResult& result) {
        writer(createResponse(id, result.toJson()));
    });
}

void HostDispatcher::handleServiceStop(const Json::Value& id) {
    Writer writer = writer_;
    service_.stop([writer, id](const LifecycleResult& result) {
        writer(createResponse(id, result.toJson()));
    });
}

void HostDispatcher::handleServiceStatus(const Json::Value& id) {
    writer_(createResponse(id, service_.status().toJson()));
}
