#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/discovery.hpp"

using namespace buspro;
using namespace std::chrono_literals;

namespace {

Telegram discovery_reply(uint8_t subnet, uint8_t device, uint16_t type_code, std::vector<uint8_t> rest = {})
{
    Telegram t;
    t.source_subnet = subnet;
    t.source_device = device;
    t.target_subnet = 200;
    t.target_device = 200;
    t.operate_code = 0x000F;
    t.payload = {static_cast<uint8_t>(type_code >> 8), static_cast<uint8_t>(type_code & 0xFF)};
    t.payload.insert(t.payload.end(), rest.begin(), rest.end());
    return t;
}

class DiscoveryTest : public ::testing::Test
{
protected:
    DiscoveryTest()
        : dispatcher_(logger_),
          engine_(dispatcher_, catalog_, [this](const Telegram& t) { return on_command(t); }, logger_)
    {
        logger_.set_log_callback([this](LogLevel level, const std::string& msg) {
            if (level == LogLevel::WARNING) warnings_.push_back(msg);
        });
        engine_.set_repeats(1, 0ms);
    }

    bool on_command(const Telegram& t)
    {
        commands_.push_back(t);
        if (answer_) {
            for (const auto& reply : answer_(t)) {
                dispatcher_.publish(reply);
            }
        }
        return true;
    }

    bool warned_about(const std::string& text) const
    {
        for (const auto& w : warnings_) {
            if (w.find(text) != std::string::npos) return true;
        }
        return false;
    }

    Logger logger_;
    EventDispatcher dispatcher_;
    DeviceCatalog catalog_;
    DiscoveryEngine engine_;
    std::vector<Telegram> commands_;
    std::vector<std::string> warnings_;
    std::function<std::vector<Telegram>(const Telegram&)> answer_;
};

} // namespace

TEST_F(DiscoveryTest, KnownTypeIsClassified)
{
    auto device = engine_.record_reply(discovery_reply(1, 10, 0x0001, {3}));

    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->category, DeviceCategory::LIGHT);
    EXPECT_EQ(device->channel_count, 3);
    EXPECT_EQ(device->channels, (std::set<uint8_t>{1, 2, 3}));
    EXPECT_TRUE(warnings_.empty());

    auto cover = engine_.record_reply(discovery_reply(1, 11, 0x0180, {1}));
    ASSERT_TRUE(cover.has_value());
    EXPECT_EQ(cover->category, DeviceCategory::COVER);
    EXPECT_EQ(cover->model, "HDL-MW02.431");
}

TEST_F(DiscoveryTest, UnknownTypeFallsBackToLight)
{
    auto device = engine_.record_reply(discovery_reply(1, 12, 0x9999, {2}));

    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->category, DeviceCategory::LIGHT);
    EXPECT_TRUE(warned_about("0x9999"));
    EXPECT_EQ(catalog_.unknown_types(), (std::set<uint16_t>{0x9999}));
}

TEST_F(DiscoveryTest, ZeroChannelCountMeansOne)
{
    auto device = engine_.record_reply(discovery_reply(1, 13, 0x0001, {0}));
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->channel_count, 1);
    EXPECT_EQ(device->channels, (std::set<uint8_t>{1}));

    auto bare = engine_.record_reply(discovery_reply(1, 14, 0x0178));
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->channel_count, 1);
}

TEST_F(DiscoveryTest, ChannelCountIsClampedToCategoryMax)
{
    auto cover = engine_.record_reply(discovery_reply(1, 15, 0x0180, {6}));
    ASSERT_TRUE(cover.has_value());
    EXPECT_EQ(cover->channel_count, max_channels(DeviceCategory::COVER));
    EXPECT_EQ(cover->channels, (std::set<uint8_t>{1, 2}));
    EXPECT_TRUE(warned_about("1.15"));

    auto light = engine_.record_reply(discovery_reply(1, 16, 0x0178, {40}));
    ASSERT_TRUE(light.has_value());
    EXPECT_EQ(light->channel_count, 12);
}

TEST_F(DiscoveryTest, InvalidRepliesAreRejected)
{
    EXPECT_FALSE(engine_.record_reply(discovery_reply(0, 10, 0x0001, {1})).has_value());
    EXPECT_FALSE(engine_.record_reply(discovery_reply(1, 0, 0x0001, {1})).has_value());
    EXPECT_FALSE(engine_.record_reply(discovery_reply(1, 10, 0x0000, {1})).has_value());

    Telegram empty = discovery_reply(1, 10, 0x0001);
    empty.payload.clear();
    EXPECT_FALSE(engine_.record_reply(empty).has_value());

    EXPECT_EQ(catalog_.size(), 0u);
}

TEST_F(DiscoveryTest, BusInterfacesAreSkipped)
{
    EXPECT_FALSE(engine_.record_reply(discovery_reply(1, 254, 0x0195, {1})).has_value());
    EXPECT_EQ(catalog_.size(), 0u);
}

TEST_F(DiscoveryTest, DuplicateRepliesDoNotAddChannels)
{
    engine_.record_reply(discovery_reply(1, 20, 0x0188, {4}));
    engine_.record_reply(discovery_reply(1, 20, 0x0188, {4}));

    EXPECT_EQ(catalog_.size(), 1u);
    EXPECT_EQ(catalog_.channel_count(), 4u);
    EXPECT_EQ(catalog_.by_category(DeviceCategory::SWITCH).size(), 1u);
}

TEST_F(DiscoveryTest, RemarkBecomesDeviceName)
{
    std::vector<uint8_t> rest = {2, 'K', 'i', 't', 'c', 'h', 'e', 'n', ' ', 0, 0, 0};
    auto device = engine_.record_reply(discovery_reply(1, 21, 0x0251, rest));

    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->name, "Kitchen");
    EXPECT_EQ(device->model, "HDL-MD0X04.40");
}

TEST_F(DiscoveryTest, ScanCollectsRepliesFromSubnet)
{
    answer_ = [](const Telegram&) {
        Telegram unrelated = discovery_reply(1, 30, 0x0001, {1});
        unrelated.operate_code = 0x0034;
        return std::vector<Telegram>{
            discovery_reply(1, 10, 0x0001, {2}),
            discovery_reply(1, 11, 0x0180, {1}),
            discovery_reply(2, 12, 0x0001, {1}),
            unrelated,
        };
    };

    auto found = engine_.scan_subnet(1, 20ms);

    ASSERT_EQ(commands_.size(), 1u);
    EXPECT_EQ(commands_[0].operate_code, 0x000E);
    EXPECT_EQ(commands_[0].target_subnet, 1);
    EXPECT_EQ(commands_[0].target_device, 0xFF);
    EXPECT_TRUE(commands_[0].payload.empty());

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(catalog_.size(), 2u);
    EXPECT_FALSE(catalog_.find(2, 12).has_value());
    // Temporary listener is gone
    EXPECT_EQ(dispatcher_.subscription_count(), 0u);
}

TEST_F(DiscoveryTest, RepeatedRequestsDoNotDuplicateDevices)
{
    engine_.set_repeats(2, 1ms);
    answer_ = [](const Telegram&) { return std::vector<Telegram>{discovery_reply(1, 10, 0x0001, {3})}; };

    auto found = engine_.scan_subnet(1, 10ms);

    EXPECT_EQ(commands_.size(), 2u);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(catalog_.channel_count(), 3u);
}

TEST_F(DiscoveryTest, DiscoverScansRangeAndGroups)
{
    engine_.set_subnet_range(1, 3);
    answer_ = [](const Telegram& request) {
        switch (request.target_subnet) {
            case 1: return std::vector<Telegram>{discovery_reply(1, 10, 0x0178, {6})};
            case 2: return std::vector<Telegram>{discovery_reply(2, 10, 0x0073, {1})};
            default: return std::vector<Telegram>{discovery_reply(3, 10, 0x018E, {4})};
        }
    };

    DeviceMap devices = engine_.discover(std::nullopt, 10ms);

    EXPECT_EQ(commands_.size(), 3u);
    EXPECT_EQ(devices[DeviceCategory::LIGHT].size(), 1u);
    EXPECT_EQ(devices[DeviceCategory::CLIMATE].size(), 1u);
    EXPECT_EQ(devices[DeviceCategory::SENSOR].size(), 1u);
    EXPECT_EQ(devices.count(DeviceCategory::COVER), 0u);
}

TEST_F(DiscoveryTest, StopEndsWindowEarly)
{
    engine_.stop();
    auto start = std::chrono::steady_clock::now();
    engine_.scan_subnet(1, 5000ms);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);

    engine_.reset();
}

TEST(DeviceTypeTable, CategoryLimits)
{
    EXPECT_EQ(max_channels(DeviceCategory::LIGHT), 12);
    EXPECT_EQ(max_channels(DeviceCategory::CLIMATE), 1);
    EXPECT_EQ(max_channels(DeviceCategory::BINARY_SENSOR), 8);

    const DeviceTypeInfo* info = find_device_type(0x0192);
    ASSERT_NE(info, nullptr);
    EXPECT_TRUE(info->ignored);
    EXPECT_EQ(find_device_type(0x9999), nullptr);
}
