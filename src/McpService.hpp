#pragma once
#include <cstdint>
#include <functional>
#include <memory>

struct ServicePorts {
    std::uint16_t httpPort = 3000;
    std::uint16_t wsPort = 3001;
};

// Handle on one instance of the auxiliary MCP server. start() and stop()
// block until the transition is complete and throw on failure.
class McpService {
public:
    virtual ~McpService() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual ServicePorts ports() const = 0;
};

using McpServiceFactory = std::function<std::unique_ptr<McpService>(const ServicePorts&)>;
