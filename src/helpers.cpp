#include "common/helpers.hpp"
#include "common/types.hpp"
#include <sstream>
#include <iomanip>

namespace buspro {

std::string bytesToHex(const std::vector<uint8_t>& data)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string to_string(const DeviceKey& key)
{
    std::ostringstream oss;
    oss << static_cast<int>(key.subnet) << '.' << static_cast<int>(key.device) << '.'
        << static_cast<int>(key.channel);
    return oss.str();
}

std::string to_string(const Telegram& telegram)
{
    std::ostringstream oss;
    oss << static_cast<int>(telegram.source_subnet) << '.' << static_cast<int>(telegram.source_device)
        << " -> " << static_cast<int>(telegram.target_subnet) << '.' << static_cast<int>(telegram.target_device)
        << " op 0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(4) << telegram.operate_code
        << " [" << bytesToHex(telegram.payload) << "]";
    return oss.str();
}

const char* category_to_string(DeviceCategory category)
{
    switch (category) {
        case DeviceCategory::LIGHT: return "light";
        case DeviceCategory::COVER: return "cover";
        case DeviceCategory::CLIMATE: return "climate";
        case DeviceCategory::SENSOR: return "sensor";
        case DeviceCategory::BINARY_SENSOR: return "binary_sensor";
        case DeviceCategory::SWITCH: return "switch";
    }
    return "unknown";
}

std::optional<DeviceCategory> category_from_string(const std::string& name)
{
    static const DeviceCategory all[] = {
        DeviceCategory::LIGHT, DeviceCategory::COVER, DeviceCategory::CLIMATE,
        DeviceCategory::SENSOR, DeviceCategory::BINARY_SENSOR, DeviceCategory::SWITCH,
    };
    for (DeviceCategory category : all) {
        if (name == category_to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

const char* error_to_string(Error error)
{
    switch (error) {
        case Error::ENCODE_ERROR: return "encode error";
        case Error::MALFORMED_FRAME: return "malformed frame";
        case Error::FRAME_TOO_SHORT: return "frame too short";
        case Error::CHECKSUM_MISMATCH: return "checksum mismatch";
        case Error::TRANSPORT_ERROR: return "transport error";
        case Error::PORT_ERROR: return "port error";
        case Error::SEND_FAILED: return "send failed";
        case Error::TIMEOUT: return "timeout";
        case Error::CANCELLED: return "cancelled";
        case Error::NOT_RUNNING: return "not running";
        case Error::INVALID_RESPONSE: return "invalid response";
        case Error::PARSE_ERROR: return "parse error";
        case Error::FILE_ERROR: return "file error";
    }
    return "unknown error";
}

} // namespace buspro
