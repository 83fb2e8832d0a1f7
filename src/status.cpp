#include "core/status.hpp"
#include "common/protocol.hpp"

namespace buspro {

namespace {

LightStatus light_from_level(uint8_t level)
{
    LightStatus status;
    status.brightness = level > 100 ? 100 : level;
    status.on = status.brightness > 0;
    return status;
}

std::optional<DeviceStatus> decode_channel_levels(uint8_t channel, const std::vector<uint8_t>& payload)
{
    // [count, level 1..count]
    if (payload.empty() || channel == 0 || channel > payload[0] || channel >= payload.size()) {
        return std::nullopt;
    }
    return light_from_level(payload[channel]);
}

std::optional<DeviceStatus> decode_climate(const std::vector<uint8_t>& payload)
{
    // [unit, current, on, mode, normal, day, night, away]
    if (payload.size() < 5) {
        return std::nullopt;
    }

    ClimateStatus status;
    status.current_temperature = payload[1];
    status.on = payload[2] != 0;
    status.mode = payload[3];

    size_t target = 4;
    if (status.mode >= 1 && status.mode <= 4 && 3u + status.mode < payload.size()) {
        target = 3 + status.mode;
    }
    status.target_temperature = payload[target];
    return status;
}

std::optional<DeviceStatus> decode_sensor(const std::vector<uint8_t>& payload)
{
    size_t index = 0;
    if (payload.size() >= 2 && payload[0] == Protocol::SUCCESS) {
        index = 1;
    }
    if (index >= payload.size()) {
        return std::nullopt;
    }

    SensorStatus status;
    status.raw = payload[index];
    status.value = payload[index];
    return status;
}

} // anonymous namespace

ReadRequest read_status_request(DeviceCategory category, uint8_t channel)
{
    using namespace Protocol::OperateCode;

    switch (category) {
        case DeviceCategory::LIGHT:
        case DeviceCategory::SWITCH:
            return ReadRequest{READ_STATUS_OF_CHANNELS, {}};
        case DeviceCategory::COVER:
            return ReadRequest{READ_CURTAIN_STATUS, {channel}};
        case DeviceCategory::CLIMATE:
            return ReadRequest{READ_FLOOR_HEATING_STATUS, {}};
        case DeviceCategory::SENSOR:
            return ReadRequest{READ_SENSOR_STATUS, {channel}};
        case DeviceCategory::BINARY_SENSOR:
            return ReadRequest{READ_DRY_CONTACT_STATUS, {channel}};
    }
    return ReadRequest{READ_STATUS_OF_CHANNELS, {}};
}

std::optional<DeviceStatus> decode_status(const DeviceKey& key, const Telegram& reply)
{
    using namespace Protocol::OperateCode;
    const auto& p = reply.payload;

    switch (reply.operate_code) {
        case READ_STATUS_OF_CHANNELS_RESPONSE:
            return decode_channel_levels(key.channel, p);

        case SINGLE_CHANNEL_CONTROL_RESPONSE:
            // [channel, success, level]
            if (p.size() < 3 || p[0] != key.channel || p[1] != Protocol::SUCCESS) {
                return std::nullopt;
            }
            return light_from_level(p[2]);

        case READ_CURTAIN_STATUS_RESPONSE:
            if (p.size() < 2 || p[0] != key.channel) {
                return std::nullopt;
            }
            return CoverStatus{static_cast<uint8_t>(p[1] > 100 ? 100 : p[1])};

        case READ_FLOOR_HEATING_STATUS_RESPONSE:
            return decode_climate(p);

        case READ_SENSOR_STATUS_RESPONSE:
            return decode_sensor(p);

        case READ_DRY_CONTACT_STATUS_RESPONSE:
            if (p.size() < 2 || p[0] != key.channel) {
                return std::nullopt;
            }
            return BinaryStatus{p[1] != 0};
    }
    return std::nullopt;
}

std::vector<StatusUpdate> decode_unsolicited(const Telegram& telegram)
{
    using namespace Protocol::OperateCode;
    std::vector<StatusUpdate> updates;
    const auto& p = telegram.payload;
    DeviceKey key{telegram.source_subnet, telegram.source_device, 0};

    auto add = [&](uint8_t channel) {
        key.channel = channel;
        auto status = decode_status(key, telegram);
        if (status) {
            updates.push_back(StatusUpdate{key, *status});
        }
    };

    switch (telegram.operate_code) {
        case READ_STATUS_OF_CHANNELS_RESPONSE:
            if (!p.empty()) {
                for (int channel = 1; channel <= p[0] && channel < static_cast<int>(p.size()); ++channel) {
                    add(static_cast<uint8_t>(channel));
                }
            }
            break;
        case SINGLE_CHANNEL_CONTROL_RESPONSE:
        case READ_CURTAIN_STATUS_RESPONSE:
        case READ_DRY_CONTACT_STATUS_RESPONSE:
            if (!p.empty()) {
                add(p[0]);
            }
            break;
        case READ_FLOOR_HEATING_STATUS_RESPONSE:
            add(1);
            break;
        default:
            break;
    }
    return updates;
}

void StatusCache::update(const DeviceKey& key, const DeviceStatus& status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = status;
}

std::optional<DeviceStatus> StatusCache::get(const DeviceKey& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<DeviceKey, DeviceStatus> StatusCache::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t StatusCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void StatusCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace buspro
