#pragma once
#include <json/json.h>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <trantor/net/EventLoopThreadPool.h>
#include "PathPolicy.hpp"
#include "StreamEvents.hpp"

// File operations exposed to the GUI. Every operation returns a structured
// result; nothing is thrown past this class.
class FileIngestController {
public:
    // Called with (channel, payload) for every event of a stream, in order.
    using EventSink = std::function<void(const std::string&, const Json::Value&)>;
    // Called once with the final result of a stream.
    using Completion = std::function<void(const Json::Value&)>;

    explicit FileIngestController(std::size_t workerThreads = 2);
    ~FileIngestController();

    // { success, data } or { success: false, error }
    Json::Value readFile(const std::string& path) const;

    // { success, info: { size, modified, name, extension } } or { success: false, error }
    Json::Value getFileInfo(const std::string& path) const;

    // Streams the file on a worker loop. Events are pushed to `sink` as they
    // are produced; `done` receives { success, totalLines, size } or
    // { success: false, error } after the terminal event.
    void streamFile(const std::string& path, std::size_t chunkSize, EventSink sink, Completion done);

    // Stops the worker loops. Streams still in flight are dropped.
    void shutdown();

    void setAllowedPaths(const std::vector<std::string>& paths);

    static const char* channelFor(const StreamEvent& event);
    static Json::Value toJson(const StreamEvent& event);

private:
    Json::Value failure(const std::string& error) const;

    PathPolicy policy_;
    std::unique_ptr<trantor::EventLoopThreadPool> workers_;
};
