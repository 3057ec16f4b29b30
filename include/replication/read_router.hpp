#pragma once

#include "store/replica_set.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace litesync {

/**
 * @brief Picks the store that serves a read
 *
 * The freshest available replica wins (highest watermark). Replicas
 * with equal watermarks take turns. With no usable replica the read
 * goes to the primary.
 */
class ReadRouter {
public:
    /**
     * @param replicas Replica set to route over
     * @param stale_after A replica whose last sync is older is skipped;
     *        zero disables the freshness check
     */
    explicit ReadRouter(std::shared_ptr<ReplicaSet> replicas,
                        std::chrono::milliseconds stale_after = std::chrono::milliseconds{0});

    /**
     * @brief Choose a replica index, or nullopt for the primary
     */
    [[nodiscard]] std::optional<size_t> route_read();

    /**
     * @brief Selection over an explicit candidate list
     * @param tie_breaker Rotates among equally fresh candidates
     */
    [[nodiscard]] static std::optional<size_t> select(
        const std::vector<RoutingCandidate>& candidates,
        std::chrono::milliseconds stale_after,
        std::chrono::steady_clock::time_point now,
        size_t tie_breaker = 0);

private:
    std::shared_ptr<ReplicaSet> replicas_;
    std::chrono::milliseconds stale_after_;
    std::atomic<size_t> rotation_{0};
};

} // namespace litesync
