#pragma once
#include <json/json.h>
#include <cstddef>
#include <functional>
#include <string>
#include "EventBroadcaster.hpp"
#include "FileIngestController.hpp"
#include "ServiceLifecycleManager.hpp"

// Routes line-delimited JSON-RPC 2.0 requests from the GUI to the file and
// service controllers.
//
// Every request with an id gets exactly one response through `writer`, which
// may be called from worker threads and must be thread-safe. Stream events are
// published on `events` with the originating request id added as "requestId".
class HostDispatcher {
public:
    using Writer = std::function<void(const Json::Value&)>;

    HostDispatcher(FileIngestController& files, ServiceLifecycleManager& service, EventBroadcaster& events,
                   Writer writer, std::size_t defaultChunkSize = 1024 * 1024);

    void processRequest(const std::string& line);
    void handleRequest(const Json::Value& request);

    static Json::Value createResponse(const Json::Value& id, const Json::Value& result);
    static Json::Value createError(const Json::Value& id, int code, const std::string& message);
    static Json::Value createNotification(const std::string& method, const Json::Value& params);

private:
    void handleReadFile(const Json::Value& id, const Json::Value& params);
    void handleReadFileStream(const Json::Value& id, const Json::Value& params);
    void handleGetFileInfo(const Json::Value& id, const Json::Value& params);
    void handleServiceStart(const Json::Value& id);
    void handleServiceStop(const Json::Value& id);
    void handleServiceStatus(const Json::Value& id);

    bool requirePath(const Json::Value& id, const Json::Value& params, std::string& path);

    FileIngestController& files_;
    ServiceLifecycleManager& service_;
    EventBroadcaster& events_;
    Writer writer_;
    std::size_t defaultChunkSize_;
};
