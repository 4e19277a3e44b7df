#include "ServiceLifecycleManager.hpp"
#include <future>
#include <stdexcept>
#include <utility>
#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>

const char* to_string(ServiceState state) {
    switch (state) {
        case ServiceState::Stopped:  return "stopped";
        case ServiceState::Starting: return "starting";
        case ServiceState::Running:  return "running";
        case ServiceState::Stopping: return "stopping";
    }
    return "unknown";
}

Json::Value ServiceStatus::toJson() const {
    Json::Value json;
    json["status"] = to_string(state);
    json["isRunning"] = isRunning();
    if (ports) {
        json["httpPort"] = ports->httpPort;
        json["wsPort"] = ports->wsPort;
    } else {
        json["httpPort"] = Json::Value::null;
        json["wsPort"] = Json::Value::null;
    }
    return json;
}

Json::Value LifecycleResult::toJson() const {
    Json::Value json;
    json["success"] = success;
    json["message"] = message;
    json["status"] = to_string(status);
    if (ports) {
        json["httpPort"] = ports->httpPort;
        json["wsPort"] = ports->wsPort;
    }
    return json;
}

namespace {

LifecycleResult make_result(bool success, std::string message, ServiceState status,
                            std::optional<ServicePorts> ports = std::nullopt) {
    LifecycleResult result;
    result.success = success;
    result.message = std::move(message);
    result.status = status;
    result.ports = ports;
    return result;
}

}

ServiceLifecycleManager::ServiceLifecycleManager(McpServiceFactory factory, ServicePorts ports)
    : factory_(std::move(factory)), ports_(ports), worker_("McpLifecycle") {
    worker_.run();
}

ServiceLifecycleManager::~ServiceLifecycleManager() {
    shutdown();
}

std::string ServiceLifecycleManager::portsDescription() const {
    return "ports " + std::to_string(ports_.httpPort) + " (HTTP) and " + std::to_string(ports_.wsPort) + " (WebSocket)";
}

void ServiceLifecycleManager::start(Callback done) {
    std::optional<LifecycleResult> immediate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case ServiceState::Running:
                immediate = make_result(true, "MCP Server is already running", state_,
                                        service_ ? service_->ports() : ports_);
                break;
            case ServiceState::Starting:
                immediate = make_result(false, "MCP Server is already starting", state_);
                break;
            case ServiceState::Stopping:
                immediate = make_result(false, "MCP Server is stopping; start it again once it has stopped", state_);
                break;
            case ServiceState::Stopped:
                state_ = ServiceState::Starting;
                break;
        }
    }
    if (immediate) {
        if (done) done(*immediate);
        return;
    }
    LOG_INFO << "Starting MCP Server on " << portsDescription();
    worker_.getLoop()->queueInLoop([this, done]() { runStart(done); });
}

void ServiceLifecycleManager::runStart(Callback done) {
    std::unique_ptr<McpService> service;
    std::string error;
    try {
        service = factory_(ports_);
        if (!service) {
            throw std::runtime_error("service factory returned no instance");
        }
        service->start();
    } catch (const std::exception& e) {
        error = e.what();
        service.reset();
    }

    LifecycleResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error.empty()) {
            ServicePorts bound = service->ports();
            service_ = std::move(service);
            if (state_ == ServiceState::Starting) {
                state_ = ServiceState::Running;
                result = make_result(true, "MCP Server started successfully on " + portsDescription(), state_, bound);
            } else {
                // A stop was accepted meanwhile; its queued teardown takes the handle
                result = make_result(false, "MCP Server start was superseded by a stop request", state_);
            }
        } else {
            if (state_ == ServiceState::Starting) {
                state_ = ServiceState::Stopped;
            }
            result = make_result(false, "Failed to start MCP Server: " + error, state_);
        }
    }
    if (result.success) {
        LOG_INFO << result.message;
    } else {
        LOG_ERROR << result.message;
    }
    if (done) done(result);
}

void ServiceLifecycleManager::stop(Callback done) {
    std::optional<LifecycleResult> immediate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case ServiceState::Stopped:
                immediate = make_result(true, "MCP Server is already stopped", state_);
                break;
            case ServiceState::Stopping:
                immediate = make_result(false, "MCP Server is already stopping", state_);
                break;
            case ServiceState::Starting:
            case ServiceState::Running:
                state_ = ServiceState::Stopping;
                break;
        }
    }
    if (immediate) {
        if (done) done(*immediate);
        return;
    }
    LOG_INFO << "Stopping MCP Server";
    worker_.getLoop()->queueInLoop([this, done]() { runStop(done); });
}

void ServiceLifecycleManager::runStop(Callback done) {
    std::unique_ptr<McpService> service;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        service = std::move(service_);
    }
    std::string error;
    if (service) {
        try {
            service->stop();
        } catch (const std::exception& e) {
            error = e.what();
        }
        service.reset();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ServiceState::Stopped;
    }

    LifecycleResult result;
    if (error.empty()) {
        result = make_result(true, "MCP Server stopped successfully", ServiceState::Stopped);
        LOG_INFO << result.message;
    } else {
        result = make_result(false, "MCP Server did not stop cleanly: " + error, ServiceState::Stopped);
        LOG_ERROR << result.message;
    }
    if (done) done(result);
}

ServiceStatus ServiceLifecycleManager::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ServiceStatus status;
    status.state = state_;
    if (state_ == ServiceState::Running) {
        status.ports = service_ ? service_->ports() : ports_;
    }
    return status;
}

void ServiceLifecycleManager::teardown() {
    std::unique_ptr<McpService> service;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        service = std::move(service_);
        if (service) {
            state_ = ServiceState::Stopping;
        }
    }
    if (service) {
        LOG_INFO << "Shutting down MCP Server";
        try {
            service->stop();
        } catch (const std::exception& e) {
            LOG_ERROR << "MCP Server did not stop cleanly: " << e.what();
        }
        service.reset();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ServiceState::Stopped;
}

void ServiceLifecycleManager::shutdown() {
    auto* loop = worker_.getLoop();
    if (loop->isInLoopThread()) {
        // Called from a lifecycle callback; waiting on the loop would deadlock
        teardown();
        return;
    }
    std::promise<void> drained;
    auto finished = drained.get_future();
    // Queued behind any accepted transition, so those complete first
    loop->queueInLoop([this, &drained]() {
        teardown();
        drained.set_value();
    });
    finished.wait();
}
