#pragma once

#include <stdint.h>
#include <string>
#include <istream>

#include "types.hpp"
#include "log.hpp"
#include "protocol.hpp"

namespace buspro {

enum class ChecksumMode
{
    ADDITIVE,   // 1 byte, sum modulo 256
    CRC16       // 2 bytes, CRC-16/XMODEM, big endian
};

enum class PollMode
{
    SUBSCRIPTIONS,  // every key with a registered callback
    CATALOG         // every discovered device channel
};

struct GatewayConfig
{
    std::string gateway_host;
    int gateway_port = Protocol::DEFAULT_GATEWAY_PORT;
    int local_port = 0;

    uint8_t source_subnet = Protocol::Address::DEFAULT_SOURCE_SUBNET;
    uint8_t source_device = Protocol::Address::DEFAULT_SOURCE_DEVICE;
    std::string source_ip = "0.0.0.0";
    ChecksumMode checksum = ChecksumMode::CRC16;

    int request_timeout_ms = Protocol::REQUEST_TIMEOUT_MS;
    int send_retries = 2;
    int retry_backoff_ms = Protocol::RETRY_BACKOFF_MS;

    int poll_interval_ms = Protocol::POLL_INTERVAL_MS;   // 0 disables polling
    int poll_delay_ms = Protocol::POLL_DELAY_MS;
    PollMode poll_mode = PollMode::SUBSCRIPTIONS;

    int discovery_timeout_ms = Protocol::DISCOVERY_TIMEOUT_MS;
    int discovery_repeats = Protocol::Discovery::REPEATS;
    uint8_t discovery_first_subnet = Protocol::Discovery::FIRST_SUBNET;
    uint8_t discovery_last_subnet = Protocol::Discovery::LAST_SUBNET;

    LogLevel log_level = LogLevel::INFO;
};

// "key = value" lines, '#' starts a comment
Result<GatewayConfig> parse_config(std::istream& in, std::string* error_line = nullptr);
Result<GatewayConfig> load_config(const std::string& path, std::string* error_line = nullptr);

} // namespace buspro
