#include <iostream>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include "../src/ServiceLifecycleManager.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

// Shared knobs for the fake services created by the factory
struct FakeState {
    std::atomic<int> created{0};
    std::atomic<int> started{0};
    std::atomic<int> stopped{0};
    std::atomic<bool> failStart{false};
    std::atomic<bool> failStop{false};
    std::shared_future<void> gate; // start() blocks on it when valid
};

class FakeService : public McpService {
public:
    FakeService(std::shared_ptr<FakeState> state, ServicePorts ports) : state_(std::move(state)), ports_(ports) {
        ++state_->created;
    }

    void start() override {
        if (state_->gate.valid()) {
            state_->gate.wait();
        }
        if (state_->failStart) {
            throw std::runtime_error("port 3000 already in use");
        }
        ++state_->started;
    }

    void stop() override {
        ++state_->stopped;
        if (state_->failStop) {
            throw std::runtime_error("server hung");
        }
    }

    ServicePorts ports() const override { return ports_; }

private:
    std::shared_ptr<FakeState> state_;
    ServicePorts ports_;
};

static McpServiceFactory fake_factory(const std::shared_ptr<FakeState>& state) {
    return [state](const ServicePorts& ports) { return std::make_unique<FakeService>(state, ports); };
}

// Runs one operation and waits for its callback
template <typename Op>
static LifecycleResult await(Op op) {
    auto promise = std::make_shared<std::promise<LifecycleResult>>();
    auto result = promise->get_future();
    op([promise](const LifecycleResult& r) { promise->set_value(r); });
    return result.get();
}

int main() {
    try {
        // 1) Stopped status has null ports; stop on stopped is a no-op success
        {
            auto state = std::make_shared<FakeState>();
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});
            ServiceStatus status = manager.status();
            ASSERT_TRUE(status.state == ServiceState::Stopped);
            ASSERT_TRUE(!status.isRunning());
            Json::Value json = status.toJson();
            ASSERT_TRUE(json["status"].asString() == "stopped");
            ASSERT_TRUE(json["httpPort"].isNull());
            ASSERT_TRUE(json["wsPort"].isNull());

            LifecycleResult r = await([&](auto cb) { manager.stop(cb); });
            ASSERT_TRUE(r.success);
            ASSERT_TRUE(r.message == "MCP Server is already stopped");
            ASSERT_TRUE(state->stopped == 0);
        }

        // 2) Start, status while running, start again, stop
        {
            auto state = std::make_shared<FakeState>();
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});
            LifecycleResult r = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(r.success);
            ASSERT_TRUE(r.status == ServiceState::Running);
            ASSERT_TRUE(r.message == "MCP Server started successfully on ports 3000 (HTTP) and 3001 (WebSocket)");

            Json::Value json = manager.status().toJson();
            ASSERT_TRUE(json["status"].asString() == "running");
            ASSERT_TRUE(json["isRunning"].asBool());
            ASSERT_TRUE(json["httpPort"].asInt() == 3000);
            ASSERT_TRUE(json["wsPort"].asInt() == 3001);

            LifecycleResult again = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(again.success);
            ASSERT_TRUE(again.message == "MCP Server is already running");
            ASSERT_TRUE(again.ports.has_value());
            ASSERT_TRUE(state->created == 1);

            LifecycleResult stopped = await([&](auto cb) { manager.stop(cb); });
            ASSERT_TRUE(stopped.success);
            ASSERT_TRUE(stopped.message == "MCP Server stopped successfully");
            ASSERT_TRUE(manager.status().state == ServiceState::Stopped);
            ASSERT_TRUE(state->stopped == 1);
        }

        // 3) Second start while the first is in flight is rejected; one instance only
        {
            auto state = std::make_shared<FakeState>();
            std::promise<void> release;
            state->gate = release.get_future().share();
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});

            auto first = std::make_shared<std::promise<LifecycleResult>>();
            auto firstResult = first->get_future();
            manager.start([first](const LifecycleResult& r) { first->set_value(r); });
            ASSERT_TRUE(manager.status().state == ServiceState::Starting);

            LifecycleResult second = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(!second.success);
            ASSERT_TRUE(second.message == "MCP Server is already starting");

            release.set_value();
            ASSERT_TRUE(firstResult.get().success);
            ASSERT_TRUE(state->created == 1);
            ASSERT_TRUE(state->started == 1);
        }

        // 4) Failed start returns to stopped; retry succeeds
        {
            auto state = std::make_shared<FakeState>();
            state->failStart = true;
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});
            LifecycleResult r = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(!r.success);
            ASSERT_TRUE(r.message.find("port 3000 already in use") != std::string::npos);
            ASSERT_TRUE(manager.status().state == ServiceState::Stopped);

            state->failStart = false;
            LifecycleResult retry = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(retry.success);
            ASSERT_TRUE(manager.status().isRunning());
        }

        // 5) Teardown failure still ends in stopped
        {
            auto state = std::make_shared<FakeState>();
            state->failStop = true;
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});
            ASSERT_TRUE(await([&](auto cb) { manager.start(cb); }).success);
            LifecycleResult r = await([&](auto cb) { manager.stop(cb); });
            ASSERT_TRUE(!r.success);
            ASSERT_TRUE(r.message.find("server hung") != std::string::npos);
            ASSERT_TRUE(manager.status().state == ServiceState::Stopped);
        }

        // 6) Stop while starting runs after the start and leaves the service stopped
        {
            auto state = std::make_shared<FakeState>();
            std::promise<void> release;
            state->gate = release.get_future().share();
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});

            auto started = std::make_shared<std::promise<LifecycleResult>>();
            auto startResult = started->get_future();
            manager.start([started](const LifecycleResult& r) { started->set_value(r); });

            auto stopped = std::make_shared<std::promise<LifecycleResult>>();
            auto stopResult = stopped->get_future();
            manager.stop([stopped](const LifecycleResult& r) { stopped->set_value(r); });
            ASSERT_TRUE(manager.status().state == ServiceState::Stopping);

            LifecycleResult again = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(!again.success);

            release.set_value();
            LifecycleResult s = startResult.get();
            ASSERT_TRUE(!s.success);
            ASSERT_TRUE(s.message.find("superseded") != std::string::npos);
            ASSERT_TRUE(stopResult.get().success);
            ASSERT_TRUE(state->stopped == 1);
            ASSERT_TRUE(manager.status().state == ServiceState::Stopped);
        }

        // 7) Custom ports are reported and shutdown tears a running service down
        {
            auto state = std::make_shared<FakeState>();
            ServicePorts ports;
            ports.httpPort = 4100;
            ports.wsPort = 4101;
            ServiceLifecycleManager manager(fake_factory(state), ports);
            LifecycleResult r = await([&](auto cb) { manager.start(cb); });
            ASSERT_TRUE(r.message.find("4100 (HTTP) and 4101 (WebSocket)") != std::string::npos);
            ASSERT_TRUE(manager.status().ports->wsPort == 4101);
            manager.shutdown();
            ASSERT_TRUE(state->stopped == 1);
            ASSERT_TRUE(manager.status().state == ServiceState::Stopped);
        }

        // 8) Shutdown from inside a lifecycle callback tears down without blocking
        {
            auto state = std::make_shared<FakeState>();
            ServiceLifecycleManager manager(fake_factory(state), ServicePorts{});
            auto inCallback = std::make_shared<std::promise<ServiceState>>();
            auto observed = inCallback->get_future();
            manager.start([&manager, inCallback](const LifecycleResult&) {
                manager.shutdown();
                inCallback->set_value(manager.status().state);
            });
            ASSERT_TRUE(observed.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
            ASSERT_TRUE(observed.get() == ServiceState::Stopped);
            ASSERT_TRUE(state->stopped == 1);
            ASSERT_TRUE(!manager.status().isRunning());
        }
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All service lifecycle tests passed" << std::endl;
    return 0;
}
