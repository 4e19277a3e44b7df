#include "HostConfig.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <trantor/utils/Logger.h>

namespace {

void read_port(const Json::Value& section, const char* key, std::uint16_t& port) {
    if (!section.isMember(key)) return;
    const Json::Value& value = section[key];
    if (!value.isIntegral() || value.asInt64() < 1 || value.asInt64() > 65535) {
        LOG_ERROR << "Invalid mcp." << key << " in config, keeping " << port;
        return;
    }
    port = static_cast<std::uint16_t>(value.asInt64());
}

void read_positive(const Json::Value& section, const char* key, std::size_t& out) {
    if (!section.isMember(key)) return;
    const Json::Value& value = section[key];
    if (!value.isIntegral() || value.asInt64() < 1) {
        LOG_ERROR << "Invalid host." << key << " in config, keeping " << out;
        return;
    }
    out = static_cast<std::size_t>(value.asUInt64());
}

}

HostConfig HostConfig::fromJson(const Json::Value& root) {
    HostConfig config;
    if (!root.isObject()) {
        return config;
    }
    if (root.isMember("log_level") && root["log_level"].isString()) {
        config.logLevel = root["log_level"].asString();
    }

    const Json::Value& host = root["host"];
    if (host.isObject()) {
        if (host.isMember("allowed_paths")) {
            for (const auto& path : host["allowed_paths"]) {
                if (!path.isString()) {
                    LOG_ERROR << "Ignoring non-string entry in host.allowed_paths";
                    continue;
                }
                config.allowedPaths.push_back(path.asString());
                LOG_DEBUG << "Allowed path: " << config.allowedPaths.back();
            }
        }
        read_positive(host, "default_chunk_size", config.defaultChunkSize);
        read_positive(host, "stream_workers", config.streamWorkers);
    }

    const Json::Value& mcp = root["mcp"];
    if (mcp.isObject()) {
        if (mcp.isMember("executable") && mcp["executable"].isString()) {
            config.serviceExecutable = mcp["executable"].asString();
        }
        read_port(mcp, "http_port", config.servicePorts.httpPort);
        read_port(mcp, "ws_port", config.servicePorts.wsPort);
    }
    return config;
}

HostConfig HostConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        LOG_INFO << "No config file at " << path << ", using defaults";
        return HostConfig{};
    }
    std::ifstream configFile(path);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        throw std::runtime_error("Failed to parse " + path + ": " + errs);
    }
    return fromJson(root);
}
