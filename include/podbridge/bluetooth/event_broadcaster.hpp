#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace podbridge::bluetooth {

// Receiving end of the event fan-out. deliver() must not block; a subscriber
// with a full outbound queue drops the message.
class EventSubscriber {
public:
    virtual ~EventSubscriber() = default;

    virtual void deliver(std::shared_ptr<const std::string> message) = 0;
    virtual bool is_open() const = 0;
};

class EventBroadcaster {
public:
    using SubscriberId = std::uint64_t;
    using SnapshotProvider = std::function<std::vector<nlohmann::json>()>;

    // Replays the current snapshot to the new subscriber before returning.
    SubscriberId subscribe(const std::shared_ptr<EventSubscriber>& subscriber);
    void unsubscribe(SubscriberId id);

    void publish(const nlohmann::json& event);
    void replay(EventSubscriber& subscriber) const;

    void set_snapshot_provider(SnapshotProvider provider);
    std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<SubscriberId, std::weak_ptr<EventSubscriber>> subscribers_;
    SubscriberId next_id_{1};
    SnapshotProvider snapshot_provider_;
};

}  // namespace podbridge::bluetooth
