#pragma once
#include <json/json.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <trantor/net/EventLoopThread.h>
#include "McpService.hpp"

enum class ServiceState {
    Stopped,
    Starting,
    Running,
    Stopping
};

const char* to_string(ServiceState state);

struct ServiceStatus {
    ServiceState state = ServiceState::Stopped;
    std::optional<ServicePorts> ports; // set only while running

    bool isRunning() const { return state == ServiceState::Running; }
    // { status, isRunning, httpPort, wsPort } with null ports unless running
    Json::Value toJson() const;
};

struct LifecycleResult {
    bool success = false;
    std::string message;
    ServiceState status = ServiceState::Stopped;
    std::optional<ServicePorts> ports;

    // { success, message, status } plus httpPort/wsPort when ports are set
    Json::Value toJson() const;
};

// Sole owner of the auxiliary MCP service and its lifecycle state.
//
// The state doubles as the transition guard: a request that would overlap an
// in-flight transition is rejected at once, never queued. Accepted
// transitions run on a private worker thread, one at a time, in the order
// they were accepted; their callbacks fire on that thread. Rejections and
// no-ops invoke the callback before start()/stop() return.
class ServiceLifecycleManager {
public:
    using Callback = std::function<void(const LifecycleResult&)>;

    ServiceLifecycleManager(McpServiceFactory factory, ServicePorts ports);
    ~ServiceLifecycleManager();

    ServiceLifecycleManager(const ServiceLifecycleManager&) = delete;
    ServiceLifecycleManager& operator=(const ServiceLifecycleManager&) = delete;

    void start(Callback done);
    void stop(Callback done);
    ServiceStatus status() const;

    // Waits for in-flight transitions, then tears down any running service.
    // From a lifecycle callback it tears down at once; transitions queued
    // behind that callback still run afterwards.
    void shutdown();

private:
    void runStart(Callback done);
    void runStop(Callback done);
    void teardown();
    std::string portsDescription() const;

    McpServiceFactory factory_;
    ServicePorts ports_;

    mutable std::mutex mutex_;
    ServiceState state_ = ServiceState::Stopped;
    std::unique_ptr<McpService> service_;

    trantor::EventLoopThread worker_;
};
