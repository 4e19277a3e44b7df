#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include "ChildProcessMcpService.hpp"
#include "EventBroadcaster.hpp"
#include "FileIngestController.hpp"
#include "HostConfig.hpp"
#include "HostDispatcher.hpp"
#include "ServiceLifecycleManager.hpp"

namespace {

std::mutex outputMutex;

void writeLine(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::string text = Json::writeString(writer, message);
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << text << std::endl;
}

trantor::Logger::LogLevel parseLogLevel(const std::string& name) {
    if (name == "trace") return trantor::Logger::kTrace;
    if (name == "debug") return trantor::Logger::kDebug;
    if (name == "warn" || name == "warning") return trantor::Logger::kWarn;
    if (name == "error") return trantor::Logger::kError;
    return trantor::Logger::kInfo;
}

// A bare executable name is looked up next to this binary first, then on PATH.
std::string resolveExecutable(const std::string& name) {
    std::filesystem::path candidate(name);
    if (candidate.has_parent_path()) {
        return name;
    }
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto sibling = self.parent_path() / candidate;
        if (std::filesystem::exists(sibling, ec)) {
            return sibling.string();
        }
    }
    return name;
}

}

int main(int argc, char* argv[]) {
    // stdout carries the protocol, so logs go to stderr
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { std::cerr.write(msg, static_cast<std::streamsize>(len)); },
        []() { std::cerr.flush(); });

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    HostConfig config;
    try {
        config = HostConfig::load(configPath);
    } catch (const std::exception& e) {
        LOG_ERROR << "Error loading config: " << e.what() << "; using defaults";
    }
    trantor::Logger::setLogLevel(parseLogLevel(config.logLevel));

    EventBroadcaster events;
    events.subscribe([](const std::string& channel, const Json::Value& payload) {
        writeLine(HostDispatcher::createNotification(channel, payload));
    });

    FileIngestController files(config.streamWorkers);
    files.setAllowedPaths(config.allowedPaths);
    if (!config.allowedPaths.empty()) {
        LOG_INFO << "Configured " << config.allowedPaths.size() << " allowed path(s)";
    }

    std::string executable = resolveExecutable(config.serviceExecutable);
    ServiceLifecycleManager service(
        [executable](const ServicePorts& ports) { return std::make_unique<ChildProcessMcpService>(executable, ports); },
        config.servicePorts);

    HostDispatcher dispatcher(files, service, events, writeLine, config.defaultChunkSize);
    LOG_INFO << "Genome host started (MCP service: " << executable << ")";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            dispatcher.processRequest(line);
        }
    }

    // Host is quitting: drop in-flight streams, then take the MCP server down
    LOG_INFO << "Input closed, shutting down";
    files.shutdown();
    service.shutdown();
    return 0;
}
