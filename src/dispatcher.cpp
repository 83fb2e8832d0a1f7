#include "core/dispatcher.hpp"
#include "common/helpers.hpp"
#include <algorithm>
#include <exception>

namespace buspro {

SubscriptionId EventDispatcher::subscribe(const DeviceKey& key, StatusHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    status_handlers_[key].emplace_back(id, std::move(handler));
    return id;
}

SubscriptionId EventDispatcher::subscribe_all(TelegramHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    telegram_handlers_.emplace_back(id, std::move(handler));
    return id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto t = std::find_if(telegram_handlers_.begin(), telegram_handlers_.end(),
                          [id](const auto& entry) { return entry.first == id; });
    if (t != telegram_handlers_.end()) {
        telegram_handlers_.erase(t);
        return true;
    }

    for (auto it = status_handlers_.begin(); it != status_handlers_.end(); ++it) {
        auto& handlers = it->second;
        auto h = std::find_if(handlers.begin(), handlers.end(),
                              [id](const auto& entry) { return entry.first == id; });
        if (h != handlers.end()) {
            handlers.erase(h);
            if (handlers.empty()) {
                status_handlers_.erase(it);
            }
            return true;
        }
    }
    return false;
}

size_t EventDispatcher::unsubscribe(const DeviceKey& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = status_handlers_.find(key);
    if (it == status_handlers_.end()) {
        return 0;
    }
    size_t removed = it->second.size();
    status_handlers_.erase(it);
    return removed;
}

size_t EventDispatcher::publish(const Telegram& telegram)
{
    std::vector<std::pair<SubscriptionId, TelegramHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = telegram_handlers_;
    }

    size_t delivered = 0;
    for (auto& [id, handler] : handlers) {
        try {
            handler(telegram);
            delivered++;
        } catch (const std::exception& e) {
            logger_.error("Telegram handler " + std::to_string(id) + " failed on " +
                          to_string(telegram) + ": " + e.what());
        } catch (...) {
            logger_.error("Telegram handler " + std::to_string(id) + " failed on " +
                          to_string(telegram) + ": unknown exception");
        }
    }
    return delivered;
}

size_t EventDispatcher::publish(const StatusUpdate& update)
{
    std::vector<std::pair<SubscriptionId, StatusHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = status_handlers_.find(update.key);
        if (it == status_handlers_.end()) {
            return 0;
        }
        handlers = it->second;
    }

    size_t delivered = 0;
    for (auto& [id, handler] : handlers) {
        try {
            handler(update);
            delivered++;
        } catch (const std::exception& e) {
            logger_.error("Status handler " + std::to_string(id) + " for " + to_string(update.key) +
                          " failed: " + e.what());
        } catch (...) {
            logger_.error("Status handler " + std::to_string(id) + " for " + to_string(update.key) +
                          " failed: unknown exception");
        }
    }
    return delivered;
}

std::vector<DeviceKey> EventDispatcher::subscribed_keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceKey> keys;
    keys.reserve(status_handlers_.size());
    for (const auto& entry : status_handlers_) {
        keys.push_back(entry.first);
    }
    return keys;
}

bool EventDispatcher::has_subscribers(const DeviceKey& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_handlers_.count(key) > 0;
}

size_t EventDispatcher::subscription_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = telegram_handlers_.size();
    for (const auto& entry : status_handlers_) {
        count += entry.second.size();
    }
    return count;
}

void EventDispatcher::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    status_handlers_.clear();
    telegram_handlers_.clear();
}

} // namespace buspro
