#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <stdint.h>

#include "common/response.hpp"
#include "common/log.hpp"
#include "core/dispatcher.hpp"

namespace buspro {

struct DeviceTypeInfo
{
    uint16_t type_code;
    DeviceCategory category;
    const char* model;
    bool ignored;   // bus interfaces, not controllable
};

const DeviceTypeInfo* find_device_type(uint16_t type_code);
int max_channels(DeviceCategory category);

class DeviceCatalog
{
public:
    // Adds the device, or the channels it does not list yet. Returns the number of new channels.
    size_t merge(const DiscoveredDevice& device);

    std::optional<DiscoveredDevice> find(uint8_t subnet, uint8_t device) const;
    std::vector<DiscoveredDevice> by_category(DeviceCategory category) const;
    DeviceMap grouped() const;
    std::vector<std::pair<DeviceKey, DeviceCategory>> channel_keys() const;

    void note_unknown_type(uint16_t type_code);
    std::set<uint16_t> unknown_types() const;

    size_t size() const;
    size_t channel_count() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::pair<uint8_t, uint8_t>, DiscoveredDevice> devices_;
    std::set<uint16_t> unknown_types_;
};

class DiscoveryEngine
{
public:
    // Fire-and-forget send of one telegram
    using CommandFunction = std::function<bool(const Telegram&)>;

    DiscoveryEngine(EventDispatcher& dispatcher, DeviceCatalog& catalog, CommandFunction command, Logger& logger);

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    void set_source(uint8_t subnet, uint8_t device);
    void set_repeats(int repeats, std::chrono::milliseconds gap);
    void set_subnet_range(uint8_t first, uint8_t last);

    std::vector<DiscoveredDevice> scan_subnet(uint8_t subnet, std::chrono::milliseconds timeout);
    DeviceMap discover(std::optional<uint8_t> subnet, std::chrono::milliseconds timeout);

    // Validates and classifies one discovery reply; the catalog entry it produced, if accepted
    std::optional<DiscoveredDevice> record_reply(const Telegram& reply);

    // Ends a running window early; partial results are kept
    void stop();
    void reset();

private:
    EventDispatcher& dispatcher_;
    DeviceCatalog& catalog_;
    CommandFunction command_;
    Logger& logger_;

    uint8_t source_subnet_;
    uint8_t source_device_;
    int repeats_;
    std::chrono::milliseconds gap_;
    uint8_t first_subnet_;
    uint8_t last_subnet_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    std::vector<DiscoveredDevice> scan(const std::vector<uint8_t>& subnets, std::chrono::milliseconds timeout);
    bool send_request(uint8_t subnet);
    bool wait_for(std::chrono::milliseconds duration);
    void log_summary();
};

} // namespace buspro
