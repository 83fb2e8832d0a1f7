#pragma once
#include <stdint.h>
#include <stddef.h>

namespace buspro {

namespace Protocol
{
    constexpr int DEFAULT_GATEWAY_PORT = 6000;

    // Timeouts (ms)
    constexpr int REQUEST_TIMEOUT_MS = 3000;
    constexpr int RETRY_BACKOFF_MS = 500;
    constexpr int POLL_INTERVAL_MS = 30000;
    constexpr int POLL_DELAY_MS = 100;
    constexpr int DISCOVERY_TIMEOUT_MS = 5000;
    constexpr int DISCOVERY_GAP_MS = 200;
    constexpr int RECEIVE_SLICE_MS = 50;

    // Framing
    constexpr char SIGNATURE[] = "HDLMIRACLE";
    constexpr size_t SIGNATURE_LEN = 10;
    constexpr uint8_t LEAD_CODE = 0xAA;
    constexpr size_t LEADER_LEN = 4;          // sender IPv4 address
    constexpr size_t SIGNATURE_WINDOW = 20;   // signature must start in this window
    constexpr size_t MIN_FRAME_LEN = 15;
    constexpr size_t MAX_PAYLOAD_LEN = 255;

    // Offsets relative to the first signature byte
    namespace Offset {
        constexpr size_t LEAD = 10;
        constexpr size_t SOURCE_SUBNET = 12;
        constexpr size_t SOURCE_DEVICE = 13;
        constexpr size_t OPERATE_CODE = 14;
        constexpr size_t TARGET_SUBNET = 16;
        constexpr size_t TARGET_DEVICE = 17;
        constexpr size_t LENGTH = 18;
        constexpr size_t PAYLOAD = 19;
    }

    // Addresses
    namespace Address {
        constexpr uint8_t BROADCAST = 0xFF;
        constexpr uint8_t DEFAULT_SOURCE_SUBNET = 200;
        constexpr uint8_t DEFAULT_SOURCE_DEVICE = 200;
    }

    constexpr uint8_t SUCCESS = 0xF8;
    constexpr uint8_t FAILURE = 0xF5;

    // Operate codes
    namespace OperateCode {
        constexpr uint16_t SCENE_CONTROL = 0x0002;
        constexpr uint16_t SCENE_CONTROL_RESPONSE = 0x0003;
        constexpr uint16_t DISCOVERY = 0x000E;
        constexpr uint16_t DISCOVERY_RESPONSE = 0x000F;
        constexpr uint16_t SINGLE_CHANNEL_CONTROL = 0x0031;
        constexpr uint16_t SINGLE_CHANNEL_CONTROL_RESPONSE = 0x0032;
        constexpr uint16_t READ_STATUS_OF_CHANNELS = 0x0033;
        constexpr uint16_t READ_STATUS_OF_CHANNELS_RESPONSE = 0x0034;

        constexpr uint16_t READ_DRY_CONTACT_STATUS = 0x15CE;
        constexpr uint16_t READ_DRY_CONTACT_STATUS_RESPONSE = 0x15CF;
        constexpr uint16_t BROADCAST_SENSOR_STATUS = 0x1644;
        constexpr uint16_t READ_SENSOR_STATUS = 0x1645;
        constexpr uint16_t READ_SENSOR_STATUS_RESPONSE = 0x1646;
        constexpr uint16_t BROADCAST_SENSOR_STATUS_AUTO = 0x1647;
        constexpr uint16_t READ_FLOOR_HEATING_STATUS = 0x1944;
        constexpr uint16_t READ_FLOOR_HEATING_STATUS_RESPONSE = 0x1945;

        constexpr uint16_t BROADCAST_UNIVERSAL_SWITCH = 0xE017;
        constexpr uint16_t UNIVERSAL_SWITCH_CONTROL = 0xE01C;
        constexpr uint16_t UNIVERSAL_SWITCH_CONTROL_RESPONSE = 0xE01D;
        constexpr uint16_t CURTAIN_CONTROL = 0xE3E0;
        constexpr uint16_t CURTAIN_CONTROL_RESPONSE = 0xE3E1;
        constexpr uint16_t READ_CURTAIN_STATUS = 0xE3E2;
        constexpr uint16_t READ_CURTAIN_STATUS_RESPONSE = 0xE3E3;
        constexpr uint16_t BROADCAST_TEMPERATURE = 0xE3E5;
    }

    // Operate codes that never get a reply
    constexpr bool expects_no_reply(uint16_t operate_code)
    {
        return operate_code == OperateCode::BROADCAST_UNIVERSAL_SWITCH ||
               operate_code == OperateCode::BROADCAST_SENSOR_STATUS ||
               operate_code == OperateCode::BROADCAST_SENSOR_STATUS_AUTO ||
               operate_code == OperateCode::BROADCAST_TEMPERATURE;
    }

    // Discovery reply payload: type code (2, big endian), channel count, remark
    namespace Discovery {
        constexpr size_t TYPE_OFFSET = 0;
        constexpr size_t CHANNEL_OFFSET = 2;
        constexpr size_t REMARK_OFFSET = 3;
        constexpr size_t REMARK_LEN = 20;
        constexpr int REPEATS = 2;
        constexpr uint8_t FIRST_SUBNET = 1;
        constexpr uint8_t LAST_SUBNET = 20;
    }
}

} // namespace buspro
