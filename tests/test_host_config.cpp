#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <json/json.h>
#include "../src/HostConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static Json::Value parse(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream iss(text);
    Json::parseFromStream(builder, iss, &root, &errs);
    return root;
}

int main() {
    auto tmpDir = std::filesystem::temp_directory_path();
    auto configFile = tmpDir / "genome_host_config_test.json";
    try {
        // 1) Defaults
        {
            HostConfig config;
            ASSERT_TRUE(config.allowedPaths.empty());
            ASSERT_TRUE(config.defaultChunkSize == 1024 * 1024);
            ASSERT_TRUE(config.servicePorts.httpPort == 3000);
            ASSERT_TRUE(config.servicePorts.wsPort == 3001);
            ASSERT_TRUE(config.logLevel == "info");
        }

        // 2) Full config
        {
            HostConfig config = HostConfig::fromJson(parse(R"({
                "log_level": "debug",
                "host": { "allowed_paths": ["/data/genomes", 42], "default_chunk_size": 65536, "stream_workers": 4 },
                "mcp": { "executable": "/opt/genome/genome_mcp_service", "http_port": 4000, "ws_port": 4001 }
            })"));
            ASSERT_TRUE(config.logLevel == "debug");
            ASSERT_TRUE(config.allowedPaths.size() == 1);
            ASSERT_TRUE(config.allowedPaths[0] == "/data/genomes");
            ASSERT_TRUE(config.defaultChunkSize == 65536);
            ASSERT_TRUE(config.streamWorkers == 4);
            ASSERT_TRUE(config.serviceExecutable == "/opt/genome/genome_mcp_service");
            ASSERT_TRUE(config.servicePorts.httpPort == 4000);
            ASSERT_TRUE(config.servicePorts.wsPort == 4001);
        }

        // 3) Invalid values keep their defaults
        {
            HostConfig config = HostConfig::fromJson(parse(R"({
                "host": { "default_chunk_size": 0, "stream_workers": "many" },
                "mcp": { "http_port": 70000, "ws_port": -1 }
            })"));
            ASSERT_TRUE(config.defaultChunkSize == 1024 * 1024);
            ASSERT_TRUE(config.streamWorkers == 2);
            ASSERT_TRUE(config.servicePorts.httpPort == 3000);
            ASSERT_TRUE(config.servicePorts.wsPort == 3001);
        }

        // 4) Missing file yields defaults, broken file throws
        {
            std::filesystem::remove(configFile);
            HostConfig config = HostConfig::load(configFile.string());
            ASSERT_TRUE(config.servicePorts.httpPort == 3000);

            { std::ofstream ofs(configFile); ofs << "{ \"host\": "; }
            bool threw = false;
            try {
                HostConfig::load(configFile.string());
            } catch (const std::runtime_error&) {
                threw = true;
            }
            ASSERT_TRUE(threw);

            { std::ofstream ofs(configFile); ofs << R"({"mcp": {"http_port": 3100}})"; }
            ASSERT_TRUE(HostConfig::load(configFile.string()).servicePorts.httpPort == 3100);
        }
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::filesystem::remove(configFile);
    std::cout << "All host config tests passed" << std::endl;
    return 0;
}
