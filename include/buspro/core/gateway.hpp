#pragma once

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "common/response.hpp"
#include "common/config.hpp"
#include "common/log.hpp"
#include "transport/frame.hpp"
#include "transport/udp.hpp"
#include "core/correlator.hpp"
#include "core/dispatcher.hpp"
#include "core/status.hpp"
#include "core/discovery.hpp"
#include "core/scheduler.hpp"

namespace buspro {

/**
 * HDL Buspro gateway over UDP.
 *
 * Owns the socket, the pending request table, the subscriptions, the device
 * catalog and the status cache. Nothing outlives stop()/destruction except
 * the catalog and the cache, which are kept for inspection.
 *
 * Callbacks run on the receive thread (unsolicited status) or on the polling
 * thread (polled status). They must not wait on send_message().
 */
class Gateway
{
public:
    explicit Gateway(GatewayConfig config);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    Result<bool> start();
    void stop();
    bool is_running() const { return running_.load(); }

    // timeout_ms == 0 uses the configured request timeout
    Result<std::vector<uint8_t>> send_message(uint8_t subnet, uint8_t device, uint16_t operate_code,
                                              const std::vector<uint8_t>& payload, int timeout_ms = 0);
    Result<std::vector<uint8_t>> send_message(std::array<uint8_t, 2> address, std::array<uint8_t, 2> operate_code,
                                              const std::vector<uint8_t>& payload, int timeout_ms = 0);
    bool send_command(uint8_t subnet, uint8_t device, uint16_t operate_code, const std::vector<uint8_t>& payload = {});

    SubscriptionId register_callback(uint8_t subnet, uint8_t device, uint8_t channel,
                                     EventDispatcher::StatusHandler handler,
                                     DeviceCategory category = DeviceCategory::LIGHT);
    bool unregister_callback(SubscriptionId id);
    size_t unregister_callback(uint8_t subnet, uint8_t device, uint8_t channel);
    SubscriptionId subscribe_telegrams(EventDispatcher::TelegramHandler handler);

    DeviceMap discover(std::optional<uint8_t> subnet = std::nullopt, int timeout_ms = 0);
    DeviceMap devices() const { return catalog_.grouped(); }
    std::optional<DeviceStatus> status(uint8_t subnet, uint8_t device, uint8_t channel) const;
    int poll_now() { return scheduler_.poll_once(); }

    Result<bool> set_channel(uint8_t subnet, uint8_t device, uint8_t channel, uint8_t level);
    Result<bool> set_cover(uint8_t subnet, uint8_t device, uint8_t channel, uint8_t position);
    Result<bool> activate_scene(uint8_t subnet, uint8_t device, uint8_t area, uint8_t scene);
    Result<bool> set_universal_switch(uint8_t subnet, uint8_t device, uint8_t switch_number, bool on);

    // Entry point for every received datagram
    void handle_datagram(const std::vector<uint8_t>& data, const Endpoint& from);

    const GatewayConfig& config() const { return config_; }
    Logger& logger() { return logger_; }
    int local_port() const { return transport_.local_port(); }
    size_t pending_requests() const { return correlator_.pending_count(); }

private:
    GatewayConfig config_;
    FrameFormat format_;
    Logger logger_;
    std::atomic<bool> running_{false};

    EventDispatcher dispatcher_;
    StatusCache cache_;
    DeviceCatalog catalog_;
    UdpTransport transport_;
    Correlator correlator_;
    DiscoveryEngine discovery_;
    PollingScheduler scheduler_;

    mutable std::mutex categories_mutex_;
    std::map<DeviceKey, DeviceCategory> categories_;

    Telegram make_telegram(uint8_t subnet, uint8_t device, uint16_t operate_code,
                           const std::vector<uint8_t>& payload) const;
    Result<size_t> send_frame(const std::vector<uint8_t>& frame);
    bool send_telegram(const Telegram& telegram);
    Result<bool> write_checked(uint8_t subnet, uint8_t device, uint16_t operate_code,
                               const std::vector<uint8_t>& payload);
    std::vector<PollTarget> poll_targets() const;
};

} // namespace buspro
