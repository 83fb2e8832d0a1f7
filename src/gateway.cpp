#include "core/gateway.hpp"
#include "common/protocol.hpp"
#include "common/helpers.hpp"
#include <arpa/inet.h>

namespace buspro {

namespace {

std::chrono::milliseconds or_default(int timeout_ms, int fallback_ms)
{
    return std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : fallback_ms);
}

} // anonymous namespace

Gateway::Gateway(GatewayConfig config)
    : config_(std::move(config)),
      logger_(config_.log_level),
      dispatcher_(logger_),
      transport_([this](const std::vector<uint8_t>& data, const Endpoint& from) { handle_datagram(data, from); },
                 logger_),
      correlator_([this](const std::vector<uint8_t>& frame) { return send_frame(frame); }, logger_),
      discovery_(dispatcher_, catalog_, [this](const Telegram& t) { return send_telegram(t); }, logger_),
      scheduler_([this]() { return poll_targets(); },
                 [this](const Telegram& request) {
                     return correlator_.send_and_await(request,
                                                       std::chrono::milliseconds(config_.request_timeout_ms),
                                                       config_.send_retries);
                 },
                 cache_, dispatcher_, logger_)
{
    format_.checksum = config_.checksum;
    format_.with_leader = true;
    if (inet_pton(AF_INET, config_.source_ip.c_str(), format_.leader.data()) != 1) {
        logger_.warning("Invalid source_ip " + config_.source_ip + ", using 0.0.0.0");
        format_.leader.fill(0);
    }

    correlator_.set_frame_format(format_);
    correlator_.set_retry_backoff(std::chrono::milliseconds(config_.retry_backoff_ms));

    discovery_.set_source(config_.source_subnet, config_.source_device);
    discovery_.set_repeats(config_.discovery_repeats, std::chrono::milliseconds(Protocol::DISCOVERY_GAP_MS));
    discovery_.set_subnet_range(config_.discovery_first_subnet, config_.discovery_last_subnet);

    scheduler_.set_source(config_.source_subnet, config_.source_device);
    scheduler_.set_interval(std::chrono::milliseconds(config_.poll_interval_ms));
    scheduler_.set_delay(std::chrono::milliseconds(config_.poll_delay_ms));
}

Gateway::~Gateway()
{
    stop();
}

Result<bool> Gateway::start()
{
    if (running_.load()) {
        return Result<bool>::success(true);
    }
    if (config_.gateway_host.empty()) {
        logger_.error("No gateway_host configured");
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    correlator_.open();
    discovery_.reset();
    scheduler_.reset();

    auto opened = transport_.start(config_.local_port);
    if (!opened.ok()) {
        return Result<bool>::failure(opened.error());
    }
    running_.store(true);

    if (config_.poll_interval_ms > 0) {
        scheduler_.start();
    }

    logger_.info("Gateway started, bus at " + config_.gateway_host + ":" + std::to_string(config_.gateway_port) +
                 ", source address " + std::to_string(config_.source_subnet) + "." +
                 std::to_string(config_.source_device));
    return Result<bool>::success(true);
}

void Gateway::stop()
{
    if (!running_.exchange(false)) {
        return;
    }

    // Pending requests are cancelled first so a poll in flight releases the scheduler thread
    discovery_.stop();
    correlator_.cancel_all();
    scheduler_.stop();
    transport_.stop();

    logger_.info("Gateway stopped");
}

Result<std::vector<uint8_t>> Gateway::send_message(uint8_t subnet, uint8_t device, uint16_t operate_code,
                                                   const std::vector<uint8_t>& payload, int timeout_ms)
{
    if (!running_.load()) {
        return Result<std::vector<uint8_t>>::failure(Error::NOT_RUNNING);
    }
    if (payload.size() > Protocol::MAX_PAYLOAD_LEN) {
        return Result<std::vector<uint8_t>>::failure(Error::ENCODE_ERROR);
    }

    Telegram request = make_telegram(subnet, device, operate_code, payload);

    if (device == Protocol::Address::BROADCAST || Protocol::expects_no_reply(operate_code)) {
        if (!send_telegram(request)) {
            return Result<std::vector<uint8_t>>::failure(Error::SEND_FAILED);
        }
        return Result<std::vector<uint8_t>>::success({});
    }

    auto reply = correlator_.send_and_await(request, or_default(timeout_ms, config_.request_timeout_ms),
                                            config_.send_retries);
    if (!reply.ok()) {
        return Result<std::vector<uint8_t>>::failure(reply.error());
    }
    return Result<std::vector<uint8_t>>::success(reply.value().payload);
}

Result<std::vector<uint8_t>> Gateway::send_message(std::array<uint8_t, 2> address, std::array<uint8_t, 2> operate_code,
                                                   const std::vector<uint8_t>& payload, int timeout_ms)
{
    uint16_t code = static_cast<uint16_t>((operate_code[0] << 8) | operate_code[1]);
    return send_message(address[0], address[1], code, payload, timeout_ms);
}

bool Gateway::send_command(uint8_t subnet, uint8_t device, uint16_t operate_code, const std::vector<uint8_t>& payload)
{
    if (!running_.load()) {
        logger_.warning("send_command while the gateway is stopped");
        return false;
    }
    return send_telegram(make_telegram(subnet, device, operate_code, payload));
}

SubscriptionId Gateway::register_callback(uint8_t subnet, uint8_t device, uint8_t channel,
                                          EventDispatcher::StatusHandler handler, DeviceCategory category)
{
    DeviceKey key{subnet, device, channel};
    {
        std::lock_guard<std::mutex> lock(categories_mutex_);
        categories_[key] = category;
    }
    return dispatcher_.subscribe(key, std::move(handler));
}

bool Gateway::unregister_callback(SubscriptionId id)
{
    return dispatcher_.unsubscribe(id);
}

size_t Gateway::unregister_callback(uint8_t subnet, uint8_t device, uint8_t channel)
{
    DeviceKey key{subnet, device, channel};
    {
        std::lock_guard<std::mutex> lock(categories_mutex_);
        categories_.erase(key);
    }
    return dispatcher_.unsubscribe(key);
}

SubscriptionId Gateway::subscribe_telegrams(EventDispatcher::TelegramHandler handler)
{
    return dispatcher_.subscribe_all(std::move(handler));
}

DeviceMap Gateway::discover(std::optional<uint8_t> subnet, int timeout_ms)
{
    if (!running_.load()) {
        logger_.warning("Discovery requested while the gateway is stopped");
        return catalog_.grouped();
    }
    return discovery_.discover(subnet, or_default(timeout_ms, config_.discovery_timeout_ms));
}

std::optional<DeviceStatus> Gateway::status(uint8_t subnet, uint8_t device, uint8_t channel) const
{
    return cache_.get(DeviceKey{subnet, device, channel});
}

Result<bool> Gateway::set_channel(uint8_t subnet, uint8_t device, uint8_t channel, uint8_t level)
{
    return write_checked(subnet, device, Protocol::OperateCode::SINGLE_CHANNEL_CONTROL, {channel, level, 0, 0});
}

Result<bool> Gateway::set_cover(uint8_t subnet, uint8_t device, uint8_t channel, uint8_t position)
{
    return write_checked(subnet, device, Protocol::OperateCode::CURTAIN_CONTROL, {channel, position});
}

Result<bool> Gateway::activate_scene(uint8_t subnet, uint8_t device, uint8_t area, uint8_t scene)
{
    return write_checked(subnet, device, Protocol::OperateCode::SCENE_CONTROL, {area, scene});
}

Result<bool> Gateway::set_universal_switch(uint8_t subnet, uint8_t device, uint8_t switch_number, bool on)
{
    return write_checked(subnet, device, Protocol::OperateCode::UNIVERSAL_SWITCH_CONTROL,
                         {switch_number, static_cast<uint8_t>(on ? 255 : 0)});
}

void Gateway::handle_datagram(const std::vector<uint8_t>& data, const Endpoint& from)
{
    auto decoded = BusproFrame::decode(data.data(), data.size(), config_.checksum);
    if (!decoded.ok()) {
        logger_.debug("Dropping datagram from " + from.host + ":" + std::to_string(from.port) + ": " +
                      error_to_string(decoded.error()));
        return;
    }

    const Telegram& telegram = decoded.value();

    // Our own broadcasts come back through the gateway
    if (telegram.source_subnet == config_.source_subnet && telegram.source_device == config_.source_device) {
        return;
    }

    if (logger_.enabled(LogLevel::DEBUG)) {
        logger_.debug("RX " + to_string(telegram));
    }

    if (correlator_.resolve(telegram)) {
        return;
    }

    dispatcher_.publish(telegram);

    for (const auto& update : decode_unsolicited(telegram)) {
        cache_.update(update.key, update.status);
        dispatcher_.publish(update);
    }
}

Telegram Gateway::make_telegram(uint8_t subnet, uint8_t device, uint16_t operate_code,
                                const std::vector<uint8_t>& payload) const
{
    Telegram telegram;
    telegram.source_subnet = config_.source_subnet;
    telegram.source_device = config_.source_device;
    telegram.target_subnet = subnet;
    telegram.target_device = device;
    telegram.operate_code = operate_code;
    telegram.payload = payload;
    return telegram;
}

Result<size_t> Gateway::send_frame(const std::vector<uint8_t>& frame)
{
    return transport_.send(frame, config_.gateway_host, config_.gateway_port);
}

bool Gateway::send_telegram(const Telegram& telegram)
{
    auto frame = BusproFrame::encode(telegram, format_);
    if (!frame.ok()) {
        logger_.error("Cannot encode " + to_string(telegram) + ": " + error_to_string(frame.error()));
        return false;
    }

    auto sent = send_frame(frame.value());
    if (!sent.ok()) {
        logger_.warning("Failed to send " + to_string(telegram) + ": " + error_to_string(sent.error()));
        return false;
    }

    if (logger_.enabled(LogLevel::DEBUG)) {
        logger_.debug("TX " + to_string(telegram));
    }
    return true;
}

Result<bool> Gateway::write_checked(uint8_t subnet, uint8_t device, uint16_t operate_code,
                                    const std::vector<uint8_t>& payload)
{
    auto reply = send_message(subnet, device, operate_code, payload);
    if (!reply.ok()) {
        return Result<bool>::failure(reply.error());
    }

    // Only the single channel control ack carries [channel, 0xF8/0xF5, level]
    const auto& p = reply.value();
    if (operate_code == Protocol::OperateCode::SINGLE_CHANNEL_CONTROL && p.size() >= 2 &&
        p[1] == Protocol::FAILURE) {
        logger_.warning("Device " + std::to_string(subnet) + "." + std::to_string(device) +
                        " rejected channel " + std::to_string(payload[0]));
        return Result<bool>::failure(Error::INVALID_RESPONSE);
    }
    return Result<bool>::success(true);
}

std::vector<PollTarget> Gateway::poll_targets() const
{
    std::vector<PollTarget> targets;

    if (config_.poll_mode == PollMode::CATALOG) {
        for (const auto& [key, category] : catalog_.channel_keys()) {
            targets.push_back(PollTarget{key, category});
        }
        return targets;
    }

    for (const auto& key : dispatcher_.subscribed_keys()) {
        PollTarget target{key, DeviceCategory::LIGHT};
        if (auto device = catalog_.find(key.subnet, key.device)) {
            target.category = device->category;
        } else {
            std::lock_guard<std::mutex> lock(categories_mutex_);
            auto it = categories_.find(key);
            if (it != categories_.end()) {
                target.category = it->second;
            }
        }
        targets.push_back(target);
    }
    return targets;
}

} // namespace buspro
