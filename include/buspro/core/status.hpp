#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include <stdint.h>

#include "common/response.hpp"

namespace buspro {

struct ReadRequest
{
    uint16_t operate_code = 0;
    std::vector<uint8_t> payload;
};

// Request that reads the state of one channel of a device in the given category
ReadRequest read_status_request(DeviceCategory category, uint8_t channel);

// Status of `key` carried by a reply, if the reply describes that channel
std::optional<DeviceStatus> decode_status(const DeviceKey& key, const Telegram& reply);

// Every channel status carried by an unsolicited telegram
std::vector<StatusUpdate> decode_unsolicited(const Telegram& telegram);

class StatusCache
{
public:
    void update(const DeviceKey& key, const DeviceStatus& status);
    std::optional<DeviceStatus> get(const DeviceKey& key) const;
    std::map<DeviceKey, DeviceStatus> snapshot() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<DeviceKey, DeviceStatus> entries_;
};

} // namespace buspro
