#include "core/scheduler.hpp"
#include "common/protocol.hpp"
#include "common/helpers.hpp"

namespace buspro {

namespace {

// Targets answered by the same read request
struct PollGroup
{
    uint8_t subnet;
    uint8_t device;
    ReadRequest request;
    std::vector<PollTarget> targets;
};

std::vector<PollGroup> group_targets(const std::vector<PollTarget>& targets)
{
    std::vector<PollGroup> groups;
    for (const auto& target : targets) {
        ReadRequest request = read_status_request(target.category, target.key.channel);
        bool merged = false;
        for (auto& group : groups) {
            if (group.subnet == target.key.subnet && group.device == target.key.device &&
                group.request.operate_code == request.operate_code && group.request.payload == request.payload) {
                group.targets.push_back(target);
                merged = true;
                break;
            }
        }
        if (!merged) {
            groups.push_back(PollGroup{target.key.subnet, target.key.device, request, {target}});
        }
    }
    return groups;
}

} // anonymous namespace

PollingScheduler::PollingScheduler(TargetProvider targets, RequestFunction request,
                                   StatusCache& cache, EventDispatcher& dispatcher, Logger& logger)
    : targets_(std::move(targets)),
      request_(std::move(request)),
      cache_(cache),
      dispatcher_(dispatcher),
      logger_(logger),
      interval_(Protocol::POLL_INTERVAL_MS),
      delay_(Protocol::POLL_DELAY_MS),
      source_subnet_(Protocol::Address::DEFAULT_SOURCE_SUBNET),
      source_device_(Protocol::Address::DEFAULT_SOURCE_DEVICE) {}

PollingScheduler::~PollingScheduler()
{
    stop();
}

void PollingScheduler::set_source(uint8_t subnet, uint8_t device)
{
    source_subnet_ = subnet;
    source_device_ = device;
}

void PollingScheduler::start()
{
    if (running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    running_.store(true);
    thread_ = std::thread([this]() { run(); });
    logger_.info("Polling every " + std::to_string(interval_.count()) + " ms");
}

void PollingScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
}

void PollingScheduler::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
}

int PollingScheduler::poll_once()
{
    auto groups = group_targets(targets_());
    int refreshed = 0;

    for (size_t i = 0; i < groups.size(); ++i) {
        if (i > 0 && delay_.count() > 0 && !wait_for(delay_)) {
            break;
        }

        const auto& group = groups[i];
        Telegram request;
        request.source_subnet = source_subnet_;
        request.source_device = source_device_;
        request.target_subnet = group.subnet;
        request.target_device = group.device;
        request.operate_code = group.request.operate_code;
        request.payload = group.request.payload;

        auto reply = request_(request);
        if (!reply.ok()) {
            if (reply.error() == Error::CANCELLED) {
                logger_.debug("Poll cycle cancelled");
                break;
            }
            logger_.warning("Polling " + std::to_string(group.subnet) + "." + std::to_string(group.device) +
                            " failed: " + error_to_string(reply.error()));
            continue;
        }

        for (const auto& target : group.targets) {
            auto status = decode_status(target.key, reply.value());
            if (!status) {
                logger_.debug("No status for " + to_string(target.key) + " in " + to_string(reply.value()));
                continue;
            }
            cache_.update(target.key, *status);
            dispatcher_.publish(StatusUpdate{target.key, *status});
            refreshed++;
        }
    }

    return refreshed;
}

void PollingScheduler::run()
{
    while (wait_for(interval_)) {
        int refreshed = poll_once();
        logger_.debug("Poll cycle refreshed " + std::to_string(refreshed) + " channel(s)");
    }
}

bool PollingScheduler::wait_for(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return stopping_; });
}

} // namespace buspro
