#pragma once
#include <stdint.h>
#include <stddef.h>
#include <array>

namespace buspro {

// CRC-16/XMODEM: poly 0x1021, init 0x0000, no reflection, no final xor
class CRC16
{
private:
    // Built once; the receive thread and callers may checksum concurrently
    static const std::array<uint16_t, 256>& table()
    {
        static const std::array<uint16_t, 256> crc_table = [] {
            std::array<uint16_t, 256> t{};
            for (int i = 0; i < 256; i++) {
                uint16_t fcs = static_cast<uint16_t>(i << 8);
                for (int j = 8; j > 0; j--) {
                    if (fcs & 0x8000) fcs = static_cast<uint16_t>((fcs << 1) ^ 0x1021);
                    else fcs = static_cast<uint16_t>(fcs << 1);
                }
                t[i] = fcs;
            }
            return t;
        }();
        return crc_table;
    }

public:
    static uint16_t calculate(const uint8_t* data, size_t len)
    {
        const auto& crc_table = table();
        uint16_t crc = 0;
        for (size_t i = 0; i < len; i++)
            crc = static_cast<uint16_t>(crc_table[((crc >> 8) ^ data[i]) & 0xFF] ^ (crc << 8));
        return crc;
    }
};

} // namespace buspro
