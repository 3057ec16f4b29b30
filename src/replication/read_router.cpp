#include "replication/read_router.hpp"

namespace litesync {

ReadRouter::ReadRouter(std::shared_ptr<ReplicaSet> replicas, std::chrono::milliseconds stale_after)
    : replicas_(std::move(replicas)), stale_after_(stale_after) {}

std::optional<size_t> ReadRouter::route_read() {
    if (!replicas_ || replicas_->size() == 0) {
        return std::nullopt;
    }
    return select(replicas_->routing_candidates(), stale_after_,
                  std::chrono::steady_clock::now(),
                  rotation_.fetch_add(1, std::memory_order_relaxed));
}

std::optional<size_t> ReadRouter::select(
    const std::vector<RoutingCandidate>& candidates,
    std::chrono::milliseconds stale_after,
    std::chrono::steady_clock::time_point now,
    size_t tie_breaker) {

    const auto usable = [&](const RoutingCandidate& c) {
        if (!c.available) return false;
        if (stale_after.count() <= 0) return true;
        return c.last_sync.has_value() && now - *c.last_sync <= stale_after;
    };

    std::optional<Timestamp> best;
    size_t ties = 0;
    for (const auto& c : candidates) {
        if (!usable(c)) continue;
        if (!best || c.watermark > *best) {
            best = c.watermark;
            ties = 1;
        } else if (c.watermark == *best) {
            ++ties;
        }
    }
    if (!best) {
        return std::nullopt;
    }

    size_t pick = tie_breaker % ties;
    for (const auto& c : candidates) {
        if (usable(c) && c.watermark == *best) {
            if (pick == 0) return c.index;
            --pick;
        }
    }
    return std::nullopt;
}

} // namespace litesync
