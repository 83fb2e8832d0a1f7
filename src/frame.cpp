#include "transport/frame.hpp"
#include "common/crc16.hpp"
#include "common/endian.hpp"
#include "common/protocol.hpp"
#include <algorithm>
#include <cstring>

namespace buspro {

Result<std::vector<uint8_t>> BusproFrame::encode(const Telegram& telegram, const FrameFormat& format)
{
    if (telegram.payload.size() > Protocol::MAX_PAYLOAD_LEN) {
        return Result<std::vector<uint8_t>>::failure(Error::ENCODE_ERROR);
    }

    std::vector<uint8_t> frame;
    frame.reserve(Protocol::LEADER_LEN + Protocol::Offset::PAYLOAD + telegram.payload.size() + 2);

    if (format.with_leader) {
        frame.insert(frame.end(), format.leader.begin(), format.leader.end());
    }

    size_t start = frame.size();
    frame.insert(frame.end(), Protocol::SIGNATURE, Protocol::SIGNATURE + Protocol::SIGNATURE_LEN);
    frame.push_back(Protocol::LEAD_CODE);
    frame.push_back(Protocol::LEAD_CODE);
    frame.push_back(telegram.source_subnet);
    frame.push_back(telegram.source_device);

    uint8_t code[2];
    write_be16(code, telegram.operate_code);
    frame.push_back(code[0]);
    frame.push_back(code[1]);

    frame.push_back(telegram.target_subnet);
    frame.push_back(telegram.target_device);
    frame.push_back(static_cast<uint8_t>(telegram.payload.size()));
    frame.insert(frame.end(), telegram.payload.begin(), telegram.payload.end());

    uint16_t cs = checksum(frame.data() + start, frame.size() - start, format.checksum);
    if (format.checksum == ChecksumMode::CRC16) {
        frame.push_back((cs >> 8) & 0xFF);  // MSB
        frame.push_back(cs & 0xFF);         // LSB
    } else {
        frame.push_back(cs & 0xFF);
    }

    return Result<std::vector<uint8_t>>::success(std::move(frame));
}

Result<Telegram> BusproFrame::decode(const uint8_t* frame, size_t len, ChecksumMode mode)
{
    if (frame == nullptr || len < Protocol::MIN_FRAME_LEN) {
        return Result<Telegram>::failure(Error::FRAME_TOO_SHORT);
    }

    long start = find_signature(frame, len);
    if (start < 0) {
        return Result<Telegram>::failure(Error::MALFORMED_FRAME);
    }

    const uint8_t* p = frame + start;
    size_t avail = len - static_cast<size_t>(start);
    if (avail < Protocol::Offset::PAYLOAD) {
        return Result<Telegram>::failure(Error::FRAME_TOO_SHORT);
    }

    Telegram telegram;
    telegram.source_subnet = p[Protocol::Offset::SOURCE_SUBNET];
    telegram.source_device = p[Protocol::Offset::SOURCE_DEVICE];
    telegram.operate_code = read_be16(p + Protocol::Offset::OPERATE_CODE);
    telegram.target_subnet = p[Protocol::Offset::TARGET_SUBNET];
    telegram.target_device = p[Protocol::Offset::TARGET_DEVICE];

    // Declared length may overrun the datagram: keep what is there
    size_t declared = p[Protocol::Offset::LENGTH];
    size_t present = std::min(declared, avail - Protocol::Offset::PAYLOAD);
    telegram.payload.assign(p + Protocol::Offset::PAYLOAD, p + Protocol::Offset::PAYLOAD + present);

    size_t cs_len = checksum_length(mode);
    size_t covered = Protocol::Offset::PAYLOAD + declared;
    if (present == declared && avail >= covered + cs_len) {
        uint16_t expected = checksum(p, covered, mode);
        uint16_t received = (cs_len == 2) ? static_cast<uint16_t>((p[covered] << 8) | p[covered + 1])
                                          : p[covered];
        if (received != expected) {
            return Result<Telegram>::failure(Error::CHECKSUM_MISMATCH);
        }
    }

    return Result<Telegram>::success(std::move(telegram));
}

bool BusproFrame::verify_checksum(const uint8_t* frame, size_t len, ChecksumMode mode)
{
    if (frame == nullptr || len < Protocol::MIN_FRAME_LEN) {
        return false;
    }

    long start = find_signature(frame, len);
    if (start < 0) {
        return false;
    }

    const uint8_t* p = frame + start;
    size_t avail = len - static_cast<size_t>(start);
    if (avail < Protocol::Offset::PAYLOAD) {
        return false;
    }

    size_t cs_len = checksum_length(mode);
    size_t covered = Protocol::Offset::PAYLOAD + p[Protocol::Offset::LENGTH];
    if (avail < covered + cs_len) {
        return false;
    }

    uint16_t expected = checksum(p, covered, mode);
    if (cs_len == 2) {
        return p[covered] == ((expected >> 8) & 0xFF) && p[covered + 1] == (expected & 0xFF);
    }
    return p[covered] == (expected & 0xFF);
}

long BusproFrame::find_signature(const uint8_t* frame, size_t len)
{
    for (size_t i = 0; i < Protocol::SIGNATURE_WINDOW && i + Protocol::SIGNATURE_LEN <= len; i++) {
        if (std::memcmp(frame + i, Protocol::SIGNATURE, Protocol::SIGNATURE_LEN) == 0) {
            return static_cast<long>(i);
        }
    }
    return -1;
}

uint16_t BusproFrame::checksum(const uint8_t* data, size_t len, ChecksumMode mode)
{
    if (mode == ChecksumMode::CRC16) {
        return CRC16::calculate(data, len);
    }

    uint8_t sum = 0;
    for (size_t i = 0; i < len; i++) {
        sum = static_cast<uint8_t>(sum + data[i]);
    }
    return sum;
}

} // namespace buspro
