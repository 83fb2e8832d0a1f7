#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "common/response.hpp"
#include "common/log.hpp"
#include "core/dispatcher.hpp"
#include "core/status.hpp"

namespace buspro {

struct PollTarget
{
    DeviceKey key;
    DeviceCategory category = DeviceCategory::LIGHT;
};

class PollingScheduler
{
public:
    using TargetProvider = std::function<std::vector<PollTarget>()>;
    using RequestFunction = std::function<Result<Telegram>(const Telegram&)>;

    PollingScheduler(TargetProvider targets, RequestFunction request,
                     StatusCache& cache, EventDispatcher& dispatcher, Logger& logger);
    ~PollingScheduler();

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    void set_interval(std::chrono::milliseconds interval) { interval_ = interval; }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
    void set_source(uint8_t subnet, uint8_t device);

    void start();
    void stop();
    // Re-arms poll_once() after stop() without starting the loop
    void reset();
    bool is_running() const { return running_.load(); }

    // One synchronous cycle; number of targets whose status was refreshed
    int poll_once();

private:
    TargetProvider targets_;
    RequestFunction request_;
    StatusCache& cache_;
    EventDispatcher& dispatcher_;
    Logger& logger_;

    std::chrono::milliseconds interval_;
    std::chrono::milliseconds delay_;
    uint8_t source_subnet_;
    uint8_t source_device_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    void run();
    bool wait_for(std::chrono::milliseconds duration);
};

} // namespace buspro
