#include <gtest/gtest.h>

#include "transport/frame.hpp"
#include "common/crc16.hpp"
#include "common/protocol.hpp"

using namespace buspro;

namespace {

Telegram channel_control()
{
    Telegram t;
    t.source_subnet = 1;
    t.source_device = 2;
    t.operate_code = 0x0031;
    t.target_subnet = 1;
    t.target_device = 5;
    t.payload = {0x01, 0x64, 0x00, 0x00};
    return t;
}

std::vector<uint8_t> encode_ok(const Telegram& t, const FrameFormat& format = {})
{
    auto frame = BusproFrame::encode(t, format);
    EXPECT_TRUE(frame.ok());
    return frame.ok() ? frame.value() : std::vector<uint8_t>{};
}

} // namespace

TEST(Crc16, MatchesXmodemCheckValue)
{
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    EXPECT_EQ(CRC16::calculate(data, sizeof(data)), 0x31C3);
}

TEST(BusproFrame, EncodesWireLayout)
{
    auto frame = encode_ok(channel_control());

    const std::vector<uint8_t> expected = {
        0x00, 0x00, 0x00, 0x00,
        'H', 'D', 'L', 'M', 'I', 'R', 'A', 'C', 'L', 'E',
        0xAA, 0xAA,
        0x01, 0x02, 0x00, 0x31, 0x01, 0x05, 0x04,
        0x01, 0x64, 0x00, 0x00,
        0x3E, 0x3A,
    };
    EXPECT_EQ(frame, expected);
}

TEST(BusproFrame, AdditiveChecksumIsOneByte)
{
    FrameFormat format;
    format.checksum = ChecksumMode::ADDITIVE;
    auto frame = encode_ok(channel_control(), format);

    ASSERT_EQ(frame.size(), 28u);
    EXPECT_EQ(frame.back(), 0xCC);

    auto decoded = BusproFrame::decode(frame.data(), frame.size(), ChecksumMode::ADDITIVE);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), channel_control());
}

TEST(BusproFrame, DecodeRestoresTelegram)
{
    Telegram t = channel_control();
    t.payload.assign(255, 0x5A);
    auto frame = encode_ok(t);

    auto decoded = BusproFrame::decode(frame.data(), frame.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), t);
    EXPECT_TRUE(BusproFrame::verify_checksum(frame.data(), frame.size()));
}

TEST(BusproFrame, DecodesFrameWithoutLeader)
{
    FrameFormat format;
    format.with_leader = false;
    auto frame = encode_ok(channel_control(), format);

    auto decoded = BusproFrame::decode(frame.data(), frame.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), channel_control());
}

TEST(BusproFrame, AnyFlippedByteIsDetected)
{
    const Telegram original = channel_control();
    const auto frame = encode_ok(original);

    for (size_t i = Protocol::LEADER_LEN; i < frame.size(); ++i) {
        auto corrupted = frame;
        corrupted[i] ^= 0x01;

        EXPECT_FALSE(BusproFrame::verify_checksum(corrupted.data(), corrupted.size())) << "byte " << i;
        auto decoded = BusproFrame::decode(corrupted.data(), corrupted.size());
        if (decoded.ok()) {
            EXPECT_NE(decoded.value(), original) << "byte " << i;
        }
    }

    // The IP leader is outside the checksum
    auto relabelled = frame;
    relabelled[0] ^= 0x01;
    EXPECT_TRUE(BusproFrame::verify_checksum(relabelled.data(), relabelled.size()));
}

TEST(BusproFrame, WrongChecksumIsRejected)
{
    auto frame = encode_ok(channel_control());
    frame.back() ^= 0xFF;

    auto decoded = BusproFrame::decode(frame.data(), frame.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error(), Error::CHECKSUM_MISMATCH);
    EXPECT_FALSE(BusproFrame::verify_checksum(frame.data(), frame.size()));
}

TEST(BusproFrame, ShortDatagramIsRejected)
{
    auto frame = encode_ok(channel_control());

    auto decoded = BusproFrame::decode(frame.data(), 14);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error(), Error::FRAME_TOO_SHORT);
}

TEST(BusproFrame, TruncatedHeaderIsRejected)
{
    auto frame = encode_ok(channel_control());

    // Leader, signature and lead code present, length byte missing
    auto decoded = BusproFrame::decode(frame.data(), Protocol::LEADER_LEN + Protocol::Offset::LENGTH);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error(), Error::FRAME_TOO_SHORT);
}

TEST(BusproFrame, MissingSignatureIsMalformed)
{
    std::vector<uint8_t> junk(40, 0x00);
    auto decoded = BusproFrame::decode(junk.data(), junk.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error(), Error::MALFORMED_FRAME);
}

TEST(BusproFrame, SignatureOutsideWindowIsMalformed)
{
    FrameFormat format;
    format.with_leader = false;
    auto frame = encode_ok(channel_control(), format);
    frame.insert(frame.begin(), Protocol::SIGNATURE_WINDOW, 0x00);

    auto decoded = BusproFrame::decode(frame.data(), frame.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error(), Error::MALFORMED_FRAME);
}

TEST(BusproFrame, OverrunningLengthIsClamped)
{
    auto frame = encode_ok(channel_control());
    // Keep only two payload bytes, drop the rest and the checksum
    frame.resize(Protocol::LEADER_LEN + Protocol::Offset::PAYLOAD + 2);

    auto decoded = BusproFrame::decode(frame.data(), frame.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().payload, (std::vector<uint8_t>{0x01, 0x64}));
    EXPECT_EQ(decoded.value().operate_code, 0x0031);
    EXPECT_FALSE(BusproFrame::verify_checksum(frame.data(), frame.size()));
}

TEST(BusproFrame, MissingTrailerIsAccepted)
{
    auto frame = encode_ok(channel_control());
    frame.resize(frame.size() - 2);

    auto decoded = BusproFrame::decode(frame.data(), frame.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), channel_control());
    EXPECT_FALSE(BusproFrame::verify_checksum(frame.data(), frame.size()));
}

TEST(BusproFrame, OversizedPayloadIsEncodeError)
{
    Telegram t = channel_control();
    t.payload.assign(256, 0x00);

    auto frame = BusproFrame::encode(t);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error(), Error::ENCODE_ERROR);
}
