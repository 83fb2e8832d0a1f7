#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

#include "core/gateway.hpp"

using namespace buspro;
using namespace std::chrono_literals;

namespace {

template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

Telegram answer(const Telegram& request, uint16_t code, std::vector<uint8_t> payload)
{
    Telegram t;
    t.source_subnet = request.target_subnet;
    t.source_device = request.target_device;
    t.target_subnet = request.source_subnet;
    t.target_device = request.source_device;
    t.operate_code = code;
    t.payload = std::move(payload);
    return t;
}

// Plays the Buspro IP gateway and the devices behind it
class BusSimulator
{
public:
    using Responder = std::function<std::vector<Telegram>(const Telegram&)>;

    BusSimulator()
        : transport_([this](const std::vector<uint8_t>& data, const Endpoint& from) { on_datagram(data, from); },
                     logger_)
    {
        logger_.set_log_callback([](LogLevel, const std::string&) {});
    }

    int start()
    {
        EXPECT_TRUE(transport_.start(0).ok());
        return transport_.local_port();
    }

    void set_responder(Responder responder)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    std::vector<Telegram> requests()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void inject(const Telegram& telegram, int port)
    {
        auto frame = BusproFrame::encode(telegram);
        ASSERT_TRUE(frame.ok());
        send_raw(frame.value(), port);
    }

    void send_raw(const std::vector<uint8_t>& data, int port)
    {
        EXPECT_TRUE(transport_.send(data, "127.0.0.1", port).ok());
    }

private:
    void on_datagram(const std::vector<uint8_t>& data, const Endpoint& from)
    {
        auto request = BusproFrame::decode(data.data(), data.size());
        if (!request.ok()) return;

        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request.value());
            responder = responder_;
        }
        if (!responder) return;

        for (const auto& reply : responder(request.value())) {
            auto frame = BusproFrame::encode(reply);
            if (frame.ok()) {
                transport_.send(frame.value(), from.host, from.port);
            }
        }
    }

    Logger logger_;
    UdpTransport transport_;
    std::mutex mutex_;
    Responder responder_;
    std::vector<Telegram> requests_;
};

class GatewayTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        GatewayConfig config;
        config.gateway_host = "127.0.0.1";
        config.gateway_port = bus_.start();
        config.request_timeout_ms = 300;
        config.send_retries = 0;
        config.poll_interval_ms = 0;
        config.poll_delay_ms = 0;
        config.discovery_repeats = 1;

        gateway_ = std::make_unique<Gateway>(config);
        gateway_->logger().set_log_callback([](LogLevel, const std::string&) {});
        ASSERT_TRUE(gateway_->start().ok());
    }

    void TearDown() override
    {
        gateway_.reset();
    }

    Telegram from_device(uint8_t subnet, uint8_t device, uint16_t code, std::vector<uint8_t> payload)
    {
        Telegram t;
        t.source_subnet = subnet;
        t.source_device = device;
        t.target_subnet = 0xFF;
        t.target_device = 0xFF;
        t.operate_code = code;
        t.payload = std::move(payload);
        return t;
    }

    BusSimulator bus_;
    std::unique_ptr<Gateway> gateway_;
};

} // namespace

TEST_F(GatewayTest, SendMessageReturnsReplyPayload)
{
    bus_.set_responder([](const Telegram& request) {
        if (request.operate_code != 0x0033) return std::vector<Telegram>{};
        return std::vector<Telegram>{answer(request, 0x0034, {2, 100, 0})};
    });

    auto reply = gateway_->send_message(1, 5, 0x0033, {});

    ASSERT_TRUE(reply.ok());
    EXPECT_EQ(reply.value(), (std::vector<uint8_t>{2, 100, 0}));
    EXPECT_EQ(gateway_->pending_requests(), 0u);

    auto requests = bus_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].source_subnet, 200);
    EXPECT_EQ(requests[0].source_device, 200);
}

TEST_F(GatewayTest, ArrayOverloadEncodesOperateCode)
{
    bus_.set_responder([](const Telegram& request) {
        return std::vector<Telegram>{answer(request, 0xE3E3, {1, 50})};
    });

    auto reply = gateway_->send_message({1, 8}, {0xE3, 0xE2}, {1});

    ASSERT_TRUE(reply.ok());
    auto requests = bus_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].operate_code, 0xE3E2);
    EXPECT_EQ(requests[0].target_device, 8);
}

TEST_F(GatewayTest, SilentDeviceTimesOut)
{
    auto reply = gateway_->send_message(1, 5, 0x0033, {}, 100);

    ASSERT_FALSE(reply.ok());
    EXPECT_EQ(reply.error(), Error::TIMEOUT);
    EXPECT_EQ(gateway_->pending_requests(), 0u);
}

TEST_F(GatewayTest, BroadcastTargetDoesNotWait)
{
    auto start = std::chrono::steady_clock::now();
    auto reply = gateway_->send_message(1, 0xFF, 0x0031, {1, 100, 0, 0});

    ASSERT_TRUE(reply.ok());
    EXPECT_TRUE(reply.value().empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 200ms);
    EXPECT_EQ(gateway_->pending_requests(), 0u);
    EXPECT_TRUE(eventually([&]() { return bus_.requests().size() == 1; }));
}

TEST_F(GatewayTest, UnsolicitedStatusReachesCallbackAndCache)
{
    std::atomic<int> brightness{-1};
    gateway_->register_callback(1, 5, 2, [&](const StatusUpdate& update) {
        brightness = std::get<LightStatus>(update.status).brightness;
    });

    bus_.inject(from_device(1, 5, 0x0032, {2, 0xF8, 70}), gateway_->local_port());

    ASSERT_TRUE(eventually([&]() { return brightness.load() == 70; }));
    auto cached = gateway_->status(1, 5, 2);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(std::get<LightStatus>(*cached).brightness, 70);
}

TEST_F(GatewayTest, CorruptAndEchoedDatagramsAreDropped)
{
    std::mutex mutex;
    std::vector<Telegram> seen;
    gateway_->subscribe_telegrams([&](const Telegram& t) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(t);
    });

    auto corrupt = BusproFrame::encode(from_device(1, 5, 0x0032, {2, 0xF8, 70}));
    ASSERT_TRUE(corrupt.ok());
    corrupt.value().back() ^= 0xFF;
    bus_.send_raw(corrupt.value(), gateway_->local_port());
    bus_.send_raw({0x01, 0x02, 0x03}, gateway_->local_port());
    bus_.inject(from_device(200, 200, 0x0032, {2, 0xF8, 70}), gateway_->local_port());
    bus_.inject(from_device(1, 6, 0x15CF, {1, 1}), gateway_->local_port());

    ASSERT_TRUE(eventually([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return !seen.empty();
    }));
    std::this_thread::sleep_for(50ms);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].source_device, 6);
    EXPECT_FALSE(gateway_->status(1, 5, 2).has_value());
}

TEST_F(GatewayTest, StopCancelsPendingRequests)
{
    auto waiting = std::async(std::launch::async, [&]() {
        return gateway_->send_message(1, 5, 0x0033, {}, 10000);
    });
    ASSERT_TRUE(eventually([&]() { return gateway_->pending_requests() == 1; }));

    gateway_->stop();

    auto result = waiting.get();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::CANCELLED);
    EXPECT_FALSE(gateway_->is_running());

    auto after = gateway_->send_message(1, 5, 0x0033, {});
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error(), Error::NOT_RUNNING);
}

TEST_F(GatewayTest, DiscoverFindsDevicesBehindGateway)
{
    bus_.set_responder([](const Telegram& request) {
        if (request.operate_code != 0x000E || request.target_subnet != 1) return std::vector<Telegram>{};
        Telegram dimmer;
        dimmer.source_subnet = 1;
        dimmer.source_device = 10;
        dimmer.target_subnet = request.source_subnet;
        dimmer.target_device = request.source_device;
        dimmer.operate_code = 0x000F;
        dimmer.payload = {0x01, 0x78, 6};
        return std::vector<Telegram>{dimmer};
    });

    DeviceMap devices = gateway_->discover(1, 200);

    ASSERT_EQ(devices[DeviceCategory::LIGHT].size(), 1u);
    const auto& dimmer = devices[DeviceCategory::LIGHT][0];
    EXPECT_EQ(dimmer.device, 10);
    EXPECT_EQ(dimmer.channel_count, 6);
    EXPECT_EQ(dimmer.model, "HDL-MPDI06.40K");
    EXPECT_EQ(gateway_->devices().size(), 1u);
}

TEST_F(GatewayTest, SetChannelChecksAcknowledgement)
{
    std::atomic<uint8_t> ack{0xF8};
    bus_.set_responder([&](const Telegram& request) {
        if (request.operate_code != 0x0031) return std::vector<Telegram>{};
        return std::vector<Telegram>{answer(request, 0x0032, {request.payload[0], ack.load(), request.payload[1]})};
    });

    auto ok = gateway_->set_channel(1, 5, 3, 40);
    ASSERT_TRUE(ok.ok());
    auto sent = bus_.requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].payload, (std::vector<uint8_t>{3, 40, 0, 0}));

    ack = 0xF5;
    auto rejected = gateway_->set_channel(1, 5, 3, 40);
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.error(), Error::INVALID_RESPONSE);
}

TEST_F(GatewayTest, PollNowUsesRegisteredCategory)
{
    bus_.set_responder([](const Telegram& request) {
        if (request.operate_code != 0xE3E2) return std::vector<Telegram>{};
        return std::vector<Telegram>{answer(request, 0xE3E3, {request.payload[0], 30})};
    });

    std::atomic<int> updates{0};
    gateway_->register_callback(1, 8, 1, [&](const StatusUpdate&) { updates++; }, DeviceCategory::COVER);

    EXPECT_EQ(gateway_->poll_now(), 1);
    EXPECT_EQ(updates.load(), 1);
    auto cached = gateway_->status(1, 8, 1);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(std::get<CoverStatus>(*cached).position, 30);

    EXPECT_EQ(gateway_->unregister_callback(1, 8, 1), 1u);
    EXPECT_EQ(gateway_->poll_now(), 0);
}

TEST_F(GatewayTest, DiscoveryReplyIsNotTakenByPendingRead)
{
    bus_.set_responder([](const Telegram& request) {
        if (request.operate_code != 0x000E) return std::vector<Telegram>{};
        Telegram dimmer;
        dimmer.source_subnet = 1;
        dimmer.source_device = 5;
        dimmer.target_subnet = request.source_subnet;
        dimmer.target_device = request.source_device;
        dimmer.operate_code = 0x000F;
        dimmer.payload = {0x01, 0x78, 6};
        return std::vector<Telegram>{dimmer};
    });

    auto read = std::async(std::launch::async, [&]() {
        return gateway_->send_message(1, 5, 0x0033, {}, 1000);
    });
    ASSERT_TRUE(eventually([&]() { return gateway_->pending_requests() == 1; }));

    DeviceMap devices = gateway_->discover(1, 200);

    ASSERT_EQ(devices[DeviceCategory::LIGHT].size(), 1u);
    EXPECT_EQ(devices[DeviceCategory::LIGHT][0].device, 5);

    auto result = read.get();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::TIMEOUT);
}

TEST_F(GatewayTest, RestartedGatewayPollsEveryTarget)
{
    GatewayConfig config = gateway_->config();
    config.poll_delay_ms = 5;
    gateway_.reset();
    gateway_ = std::make_unique<Gateway>(config);
    gateway_->logger().set_log_callback([](LogLevel, const std::string&) {});
    ASSERT_TRUE(gateway_->start().ok());

    bus_.set_responder([](const Telegram& request) {
        if (request.operate_code != 0x0033) return std::vector<Telegram>{};
        return std::vector<Telegram>{answer(request, 0x0034, {1, 80})};
    });
    gateway_->register_callback(1, 5, 1, [](const StatusUpdate&) {});
    gateway_->register_callback(1, 6, 1, [](const StatusUpdate&) {});

    gateway_->stop();
    ASSERT_TRUE(gateway_->start().ok());

    EXPECT_EQ(gateway_->poll_now(), 2);
    EXPECT_TRUE(gateway_->status(1, 6, 1).has_value());
}

TEST_F(GatewayTest, CoverAckNeedsNoStatusByte)
{
    bus_.set_responder([](const Telegram& request) {
        if (request.operate_code != 0xE3E0) return std::vector<Telegram>{};
        return std::vector<Telegram>{answer(request, 0xE3E1, {request.payload[0], request.payload[1]})};
    });

    auto result = gateway_->set_cover(1, 8, 1, 100);

    ASSERT_TRUE(result.ok());
    auto sent = bus_.requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].payload, (std::vector<uint8_t>{1, 100}));
}
