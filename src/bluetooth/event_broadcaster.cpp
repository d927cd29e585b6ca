#include "podbridge/bluetooth/event_broadcaster.hpp"

#include <utility>

#include "podbridge/bluetooth/messages.hpp"

namespace podbridge::bluetooth {

EventBroadcaster::SubscriberId EventBroadcaster::subscribe(const std::shared_ptr<EventSubscriber>& subscriber) {
    SubscriberId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        subscribers_.emplace(id, subscriber);
    }
    if (subscriber) {
        replay(*subscriber);
    }
    return id;
}

void EventBroadcaster::unsubscribe(SubscriberId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

void EventBroadcaster::publish(const nlohmann::json& event) {
    auto message = std::make_shared<const std::string>(messages::serialize(event));

    std::vector<std::shared_ptr<EventSubscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(subscribers_.size());
        for (auto it = subscribers_.begin(); it != subscribers_.end();) {
            if (auto subscriber = it->second.lock()) {
                targets.push_back(std::move(subscriber));
                ++it;
            } else {
                it = subscribers_.erase(it);
            }
        }
    }

    for (const auto& subscriber : targets) {
        if (subscriber->is_open()) {
            subscriber->deliver(message);
        }
    }
}

void EventBroadcaster::replay(EventSubscriber& subscriber) const {
    SnapshotProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = snapshot_provider_;
    }
    if (!provider || !subscriber.is_open()) {
        return;
    }
    for (const auto& event : provider()) {
        subscriber.deliver(std::make_shared<const std::string>(messages::serialize(event)));
    }
}

void EventBroadcaster::set_snapshot_provider(SnapshotProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_provider_ = std::move(provider);
}

std::size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [_, subscriber] : subscribers_) {
        if (!subscriber.expired()) {
            ++count;
        }
    }
    return count;
}

}  // namespace podbridge::bluetooth
