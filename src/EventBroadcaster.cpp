#include "EventBroadcaster.hpp"
#include <vector>

std::uint64_t EventBroadcaster::subscribe(Listener listener) {
    std::lock_guard lock(mtx);
    std::uint64_t id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void EventBroadcaster::unsubscribe(std::uint64_t id) {
    std::lock_guard lock(mtx);
    listeners_.erase(id);
}

void EventBroadcaster::broadcast(const std::string& channel, const Json::Value& payload) {
    // Copy under the lock so a listener may unsubscribe itself
    std::vector<Listener> targets;
    {
        std::lock_guard lock(mtx);
        targets.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            targets.push_back(entry.second);
        }
    }
    for (auto& listener : targets) {
        listener(channel, payload);
    }
}

std::size_t EventBroadcaster::subscriberCount() const {
    std::lock_guard lock(mtx);
    return listeners_.size();
}
