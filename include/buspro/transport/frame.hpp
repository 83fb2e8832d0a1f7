#pragma once

#include <vector>
#include <array>
#include <stdint.h>

#include "common/types.hpp"
#include "common/response.hpp"
#include "common/config.hpp"

namespace buspro {

struct FrameFormat
{
    ChecksumMode checksum = ChecksumMode::CRC16;
    bool with_leader = true;
    std::array<uint8_t, 4> leader{0, 0, 0, 0};   // sender IPv4 address
};

class BusproFrame
{
public:
    static Result<std::vector<uint8_t>> encode(const Telegram& telegram, const FrameFormat& format = {});
    static Result<Telegram> decode(const uint8_t* frame, size_t len, ChecksumMode mode = ChecksumMode::CRC16);
    static bool verify_checksum(const uint8_t* frame, size_t len, ChecksumMode mode = ChecksumMode::CRC16);

    static size_t checksum_length(ChecksumMode mode)
    {
        return mode == ChecksumMode::CRC16 ? 2 : 1;
    }

private:
    // Offset of the first signature byte, or -1
    static long find_signature(const uint8_t* frame, size_t len);
    static uint16_t checksum(const uint8_t* data, size_t len, ChecksumMode mode);
};

} // namespace buspro
