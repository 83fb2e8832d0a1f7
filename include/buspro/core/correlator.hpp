#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "common/response.hpp"
#include "common/log.hpp"
#include "transport/frame.hpp"

namespace buspro {

// Empty fields are wildcards
struct CorrelationKey
{
    std::optional<uint8_t> subnet;
    std::optional<uint8_t> device;
    std::optional<uint16_t> operate_code;

    static CorrelationKey for_request(const Telegram& request)
    {
        return CorrelationKey{request.target_subnet, request.target_device, request.operate_code};
    }
};

/**
 * Matches asynchronous replies to the requests waiting for them.
 *
 * The bus carries no request ids, so a reply is attributed by its source
 * address and operate code. Inbound telegrams are tried against the pending
 * table in three tiers (exact key, same device with any operate code, same
 * operate code from a wildcard address), oldest request first inside a tier.
 * At most one request is resolved per inbound telegram.
 *
 * Only send failures are retried. A request that was sent but never answered
 * ends with Error::TIMEOUT; repeating it is the caller's decision.
 */
class Correlator
{
public:
    using SendFunction = std::function<Result<size_t>(const std::vector<uint8_t>&)>;

    Correlator(SendFunction send, Logger& logger, FrameFormat format = {});

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    void set_frame_format(const FrameFormat& format) { format_ = format; }
    void set_retry_backoff(std::chrono::milliseconds backoff) { retry_backoff_ = backoff; }

    Result<Telegram> send_and_await(const Telegram& request, std::chrono::milliseconds timeout, int max_retries);
    Result<Telegram> send_and_await(const Telegram& request, const CorrelationKey& expect,
                                    std::chrono::milliseconds timeout, int max_retries);

    // True if the telegram was claimed by a waiting request
    bool resolve(const Telegram& inbound);

    // Fails every outstanding request with Error::CANCELLED and refuses new ones until open()
    void cancel_all();
    void open();

    size_t pending_count() const;

private:
    using Clock = std::chrono::steady_clock;

    struct PendingRequest
    {
        uint64_t id = 0;
        CorrelationKey key;
        std::promise<Result<Telegram>> result;
        int retries_remaining = 0;
        Clock::time_point created_at;
        Clock::time_point deadline;
    };

    enum class Tier { EXACT, DEVICE, BROADCAST };

    SendFunction send_;
    Logger& logger_;
    FrameFormat format_;
    std::chrono::milliseconds retry_backoff_{500};

    mutable std::mutex mutex_;
    std::list<std::shared_ptr<PendingRequest>> pending_;
    uint64_t next_id_ = 1;
    bool closed_ = false;

    static bool matches(const CorrelationKey& key, const Telegram& inbound, Tier tier);
    std::shared_ptr<PendingRequest> take(uint64_t id);
};

} // namespace buspro
