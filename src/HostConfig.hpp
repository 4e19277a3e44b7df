#pragma once
#include <json/json.h>
#include <cstddef>
#include <string>
#include <vector>
#include "McpService.hpp"

// Host settings read from config.json:
//
//   {
//     "log_level": "info",
//     "host": { "allowed_paths": [...], "default_chunk_size": 1048576, "stream_workers": 2 },
//     "mcp":  { "executable": "genome_mcp_service", "http_port": 3000, "ws_port": 3001 }
//   }
//
// Every key is optional. Invalid values are logged and the default is kept.
struct HostConfig {
    std::vector<std::string> allowedPaths;
    std::size_t defaultChunkSize = 1024 * 1024;
    std::size_t streamWorkers = 2;
    std::string serviceExecutable = "genome_mcp_service";
    ServicePorts servicePorts;
    std::string logLevel = "info";

    static HostConfig fromJson(const Json::Value& root);

    // Throws std::runtime_error if the file exists but cannot be parsed.
    // A missing file yields the defaults.
    static HostConfig load(const std::string& path);
};
