#pragma once

#include <stdint.h>
#include <cstdint>
#include <string>
#include <vector>
#include <set>
#include <map>
#include <variant>
#include <tuple>

namespace buspro {

struct Telegram
{
    uint8_t source_subnet = 0;
    uint8_t source_device = 0;
    uint8_t target_subnet = 0;
    uint8_t target_device = 0;
    uint16_t operate_code = 0;
    std::vector<uint8_t> payload;

    bool operator==(const Telegram&) const = default;
};

enum class DeviceCategory : uint8_t
{
    LIGHT,
    COVER,
    CLIMATE,
    SENSOR,
    BINARY_SENSOR,
    SWITCH
};

struct DeviceKey
{
    uint8_t subnet = 0;
    uint8_t device = 0;
    uint8_t channel = 0;

    bool operator==(const DeviceKey&) const = default;
    bool operator<(const DeviceKey& other) const
    {
        return std::tie(subnet, device, channel) < std::tie(other.subnet, other.device, other.channel);
    }
};

struct DiscoveredDevice
{
    uint8_t subnet = 0;
    uint8_t device = 0;
    uint16_t type_code = 0;
    DeviceCategory category = DeviceCategory::LIGHT;
    int channel_count = 1;
    std::set<uint8_t> channels;
    std::string model;
    std::string name;
};

using DeviceMap = std::map<DeviceCategory, std::vector<DiscoveredDevice>>;

struct LightStatus
{
    bool on = false;
    uint8_t brightness = 0;   // percent
};

struct CoverStatus
{
    uint8_t position = 0;     // percent
};

struct ClimateStatus
{
    bool on = false;
    uint8_t mode = 0;
    double current_temperature = 0.0;
    double target_temperature = 0.0;
};

struct SensorStatus
{
    uint8_t raw = 0;
    double value = 0.0;
};

struct BinaryStatus
{
    bool on = false;
};

using DeviceStatus = std::variant<LightStatus, CoverStatus, ClimateStatus, SensorStatus, BinaryStatus>;

struct StatusUpdate
{
    DeviceKey key;
    DeviceStatus status;
};

} // namespace buspro
