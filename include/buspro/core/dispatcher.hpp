#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <vector>
#include <stdint.h>

#include "common/response.hpp"
#include "common/log.hpp"

namespace buspro {

using SubscriptionId = uint64_t;

class EventDispatcher
{
public:
    using StatusHandler = std::function<void(const StatusUpdate&)>;
    using TelegramHandler = std::function<void(const Telegram&)>;

    explicit EventDispatcher(Logger& logger) : logger_(logger) {}

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    SubscriptionId subscribe(const DeviceKey& key, StatusHandler handler);
    SubscriptionId subscribe_all(TelegramHandler handler);
    bool unsubscribe(SubscriptionId id);
    size_t unsubscribe(const DeviceKey& key);

    // Handlers run synchronously, in registration order. Returns how many ran without throwing.
    size_t publish(const Telegram& telegram);
    size_t publish(const StatusUpdate& update);

    std::vector<DeviceKey> subscribed_keys() const;
    bool has_subscribers(const DeviceKey& key) const;
    size_t subscription_count() const;
    void clear();

private:
    Logger& logger_;
    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<DeviceKey, std::vector<std::pair<SubscriptionId, StatusHandler>>> status_handlers_;
    std::vector<std::pair<SubscriptionId, TelegramHandler>> telegram_handlers_;
};

} // namespace buspro
