#include <drogon/drogon.h>
#include <drogon/WebSocketController.h>
#include <json/json.h>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>

// Auxiliary MCP server launched by the genome host. Listens on the HTTP and
// WebSocket ports given on the command line and prints "READY <http> <ws>"
// on stdout once both listeners are up. SIGTERM stops it.

namespace {

std::atomic<std::size_t> connectedClients{0};

Json::Value createResponse(const Json::Value& id, const Json::Value& result) {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value createError(const Json::Value& id, int code, const std::string& message) {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value initializeResult() {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["serverInfo"]["name"] = "genome-mcp-service";
    result["serverInfo"]["version"] = "1.0.0";
    return result;
}

// Tools are provided by the connected genome browser clients
Json::Value toolsResult() {
    Json::Value result;
    result["tools"] = Json::Value(Json::arrayValue);
    return result;
}

void handleMcpRequest(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(createError(Json::Value::null, -32700, "Parse error"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    std::string method = (*json)["method"].asString();
    Json::Value id = (*json)["id"];

    if (method == "initialize") {
        callback(drogon::HttpResponse::newHttpJsonResponse(createResponse(id, initializeResult())));
    } else if (method == "tools/list") {
        callback(drogon::HttpResponse::newHttpJsonResponse(createResponse(id, toolsResult())));
    } else if (method == "ping") {
        callback(drogon::HttpResponse::newHttpJsonResponse(createResponse(id, Json::objectValue)));
    } else if (method == "notifications/initialized") {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
    } else {
        callback(drogon::HttpResponse::newHttpJsonResponse(createError(id, -32601, "Method not found: " + method)));
    }
}

bool parsePort(const char* text, std::uint16_t& port) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 1 || value > 65535) {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

}

class BrowserSocket : public drogon::WebSocketController<BrowserSocket> {
public:
    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn, std::string&& message,
                          const drogon::WebSocketMessageType& type) override {
        if (type != drogon::WebSocketMessageType::Text) {
            return;
        }
        Json::Value request;
        Json::CharReaderBuilder builder;
        std::string errs;
        std::istringstream iss(message);
        Json::Value reply;
        if (!Json::parseFromStream(builder, iss, &request, &errs)) {
            reply["type"] = "error";
            reply["message"] = "Invalid JSON";
        } else if (request["type"].asString() == "ping") {
            reply["type"] = "pong";
        } else {
            reply["type"] = "ack";
            reply["received"] = request["type"];
        }
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        conn->send(Json::writeString(writer, reply));
    }

    void handleNewConnection(const drogon::HttpRequestPtr&, const drogon::WebSocketConnectionPtr&) override {
        LOG_INFO << "Browser client connected (" << ++connectedClients << " total)";
    }

    void handleConnectionClosed(const drogon::WebSocketConnectionPtr&) override {
        LOG_INFO << "Browser client disconnected (" << --connectedClients << " remaining)";
    }

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/");
    WS_PATH_ADD("/ws");
    WS_PATH_LIST_END
};

int main(int argc, char* argv[]) {
    using namespace drogon;

    // stdout is the readiness pipe of the parent host
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { std::cerr.write(msg, static_cast<std::streamsize>(len)); },
        []() { std::cerr.flush(); });

    std::uint16_t httpPort = 3000;
    std::uint16_t wsPort = 3001;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = false;
        if (arg == "--http-port" && i + 1 < argc) {
            ok = parsePort(argv[++i], httpPort);
        } else if (arg == "--ws-port" && i + 1 < argc) {
            ok = parsePort(argv[++i], wsPort);
        }
        if (!ok) {
            std::cerr << "usage: " << argv[0] << " [--http-port N] [--ws-port N]" << std::endl;
            return 2;
        }
    }
    if (httpPort == wsPort) {
        std::cerr << "HTTP and WebSocket ports must differ" << std::endl;
        return 2;
    }

    app().registerHandler("/health",
        [](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& callback) {
            Json::Value body;
            body["status"] = "healthy";
            body["clients"] = static_cast<Json::UInt64>(connectedClients.load());
            callback(HttpResponse::newHttpJsonResponse(body));
        },
        {Get});

    app().registerHandler("/tools",
        [](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& callback) {
            callback(HttpResponse::newHttpJsonResponse(toolsResult()));
        },
        {Get});

    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    // CORS support
    app().registerPreHandlingAdvice(
        [](const HttpRequestPtr& req, AdviceCallback&& respond, AdviceChainCallback&& pass) {
            if (req->method() == Options) {
                auto resp = HttpResponse::newHttpResponse();
                resp->addHeader("Access-Control-Allow-Origin", "*");
                resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
                resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
                respond(resp);
                return;
            }
            pass();
        });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    // Both listeners serve the same routes; browsers connect their socket to wsPort
    app().addListener("127.0.0.1", httpPort);
    app().addListener("127.0.0.1", wsPort);
    app().setThreadNum(1);

    // Advices run before startListening() in the same loop task; the queued
    // print runs after it, once both listeners accept connections
    app().registerBeginningAdvice([httpPort, wsPort]() {
        app().getLoop()->queueInLoop([httpPort, wsPort]() {
            std::cout << "READY " << httpPort << " " << wsPort << std::endl;
        });
    });

    LOG_INFO << "MCP service starting on ports " << httpPort << " (HTTP) and " << wsPort << " (WebSocket)";
    app().run();
    LOG_INFO << "MCP service stopped";
    return 0;
}
