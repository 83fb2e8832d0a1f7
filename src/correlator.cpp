#include "core/correlator.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"
#include <algorithm>

namespace buspro {

Correlator::Correlator(SendFunction send, Logger& logger, FrameFormat format)
    : send_(std::move(send)), logger_(logger), format_(format) {}

Result<Telegram> Correlator::send_and_await(const Telegram& request, std::chrono::milliseconds timeout, int max_retries)
{
    return send_and_await(request, CorrelationKey::for_request(request), timeout, max_retries);
}

Result<Telegram> Correlator::send_and_await(const Telegram& request, const CorrelationKey& expect,
                                            std::chrono::milliseconds timeout, int max_retries)
{
    auto frame = BusproFrame::encode(request, format_);
    if (!frame.ok()) {
        logger_.error("Cannot encode " + to_string(request) + ": " + error_to_string(frame.error()));
        return Result<Telegram>::failure(frame.error());
    }

    auto entry = std::make_shared<PendingRequest>();
    entry->key = expect;
    entry->retries_remaining = std::max(0, max_retries);
    entry->created_at = Clock::now();
    std::future<Result<Telegram>> future = entry->result.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Result<Telegram>::failure(Error::CANCELLED);
        }
        entry->id = next_id_++;
        pending_.push_back(entry);
    }
    const uint64_t id = entry->id;

    while (true) {
        auto sent = send_(frame.value());
        if (sent.ok()) break;

        if (entry->retries_remaining <= 0) {
            if (take(id)) {
                logger_.warning("Giving up sending " + to_string(request) + ": " + error_to_string(sent.error()));
                return Result<Telegram>::failure(Error::SEND_FAILED);
            }
            // Cancelled or answered while we were failing to send
            return future.get();
        }

        entry->retries_remaining--;
        logger_.debug("Send failed, retrying " + to_string(request) + " (" +
                      std::to_string(entry->retries_remaining) + " left)");

        if (future.wait_for(retry_backoff_) == std::future_status::ready) {
            take(id);
            return future.get();
        }
    }

    entry->deadline = Clock::now() + timeout;
    if (future.wait_until(entry->deadline) == std::future_status::ready) {
        return future.get();
    }

    if (take(id)) {
        logger_.debug("No reply to " + to_string(request));
        return Result<Telegram>::failure(Error::TIMEOUT);
    }

    // A resolver claimed the entry just before the deadline
    return future.get();
}

bool Correlator::resolve(const Telegram& inbound)
{
    std::shared_ptr<PendingRequest> hit;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (Tier tier : {Tier::EXACT, Tier::DEVICE, Tier::BROADCAST}) {
            auto it = std::find_if(pending_.begin(), pending_.end(),
                                   [&](const std::shared_ptr<PendingRequest>& p) {
                                       return matches(p->key, inbound, tier);
                                   });
            if (it != pending_.end()) {
                hit = *it;
                pending_.erase(it);
                break;
            }
        }
    }

    if (!hit) {
        return false;
    }

    hit->result.set_value(Result<Telegram>::success(inbound));
    return true;
}

void Correlator::cancel_all()
{
    std::list<std::shared_ptr<PendingRequest>> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cancelled.swap(pending_);
    }

    if (!cancelled.empty()) {
        logger_.info("Cancelling " + std::to_string(cancelled.size()) + " pending request(s)");
    }
    for (auto& entry : cancelled) {
        entry->result.set_value(Result<Telegram>::failure(Error::CANCELLED));
    }
}

void Correlator::open()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

size_t Correlator::pending_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool Correlator::matches(const CorrelationKey& key, const Telegram& inbound, Tier tier)
{
    switch (tier) {
        case Tier::EXACT:
            return key.subnet && key.device && key.operate_code &&
                   *key.subnet == inbound.source_subnet &&
                   *key.device == inbound.source_device &&
                   *key.operate_code == inbound.operate_code;
        case Tier::DEVICE:
            // Discovery replies go to the discovery listener unless asked for by name
            if (inbound.operate_code == Protocol::OperateCode::DISCOVERY_RESPONSE) {
                return false;
            }
            return key.subnet && key.device &&
                   *key.subnet == inbound.source_subnet &&
                   *key.device == inbound.source_device;
        case Tier::BROADCAST:
            return key.operate_code && *key.operate_code == inbound.operate_code &&
                   (!key.subnet || *key.subnet == inbound.source_subnet) &&
                   (!key.device || *key.device == inbound.source_device);
    }
    return false;
}

std::shared_ptr<Correlator::PendingRequest> Correlator::take(uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [id](const std::shared_ptr<PendingRequest>& p) { return p->id == id; });
    if (it == pending_.end()) {
        return nullptr;
    }
    auto entry = *it;
    pending_.erase(it);
    return entry;
}

} // namespace buspro
