#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <json/json.h>

// Fans named JSON events out to subscribers. Delivery happens on the
// broadcasting thread, in subscription order.
class EventBroadcaster {
public:
    using Listener = std::function<void(const std::string& channel, const Json::Value& payload)>;

    std::uint64_t subscribe(Listener listener);
    void unsubscribe(std::uint64_t id);
    void broadcast(const std::string& channel, const Json::Value& payload);
    std::size_t subscriberCount() const;

private:
    std::map<std::uint64_t, Listener> listeners_;
    std::uint64_t nextId_ = 1;
    mutable std::mutex mtx;
};
