#pragma once
#include <sys/types.h>
#include <string>
#include "McpService.hpp"

// Runs the MCP server as a child process. start() forks and execs the service
// executable with the configured ports and blocks until the child reports
// "READY" on its stdout pipe, or exits. stop() sends SIGTERM and reaps it.
class ChildProcessMcpService : public McpService {
public:
    ChildProcessMcpService(std::string executable, ServicePorts ports);
    ~ChildProcessMcpService() override;

    void start() override;
    void stop() override;
    ServicePorts ports() const override;

    pid_t pid() const;

private:
    std::string executable_;
    ServicePorts ports_;
    pid_t pid_ = -1;
};
