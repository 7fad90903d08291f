#pragma once

/// @file matchmaking_queue.hpp
/// @brief Rating-window matchmaking queue.
///
/// A join either pairs the requester with the first compatible waiting
/// player or appends the requester to the queue. Compatibility means the
/// same match type and a rating gap within the requester's own range;
/// the waiting player's range is not consulted.

#include "arena/foundation/arena_result.hpp"
#include "arena/service/match_lifecycle.hpp"
#include "arena/service/pvp_types.hpp"
#include "arena/service/ranking_service.hpp"
#include "arena/service/season_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace arena::service {

/// Thread-safe matchmaking queue.
///
/// Usage:
/// @code
///   MatchmakingQueue queue(config, seasons, rankings, matches);
///   auto joined = queue.joinQueue(PlayerId(7));
///   if (joined && joinQueueStatus(joined.value()) == JoinQueueStatus::Matched) {
///       auto& match = std::get<MatchedResult>(joined.value()).match;
///   }
/// @endcode
class MatchmakingQueue {
public:
    MatchmakingQueue(QueueConfig config,
                     const ISeasonLookup& seasons,
                     RankingService& rankings,
                     MatchLifecycle& matches,
                     foundation::ClockFn clock = foundation::systemClock());

    /// Join the queue or get matched immediately.
    ///
    /// Duplicate check, scan, dequeue, match creation and append all run
    /// under the queue mutex.
    ///
    /// @param ratingRange  Accepted rating gap; the configured default when empty.
    /// @return NoActiveSeason when no season is active, or a store error.
    [[nodiscard]] ArenaResult<JoinQueueResult> joinQueue(
        PlayerId playerId,
        MatchType matchType = MatchType::Arena,
        std::optional<int32_t> ratingRange = std::nullopt);

    /// Remove a player's entry.
    [[nodiscard]] CancelQueueResult cancelQueue(PlayerId playerId);

    [[nodiscard]] bool isQueued(PlayerId playerId) const;

    [[nodiscard]] std::size_t queueSize() const;

    /// Entries in queue order.
    [[nodiscard]] std::vector<QueueEntry> snapshot() const;

    [[nodiscard]] const QueueConfig& config() const noexcept;

private:
    /// Index of the first entry compatible with @p requester, if any.
    [[nodiscard]] std::optional<std::size_t> findOpponent(const QueueEntry& requester) const;

    [[nodiscard]] std::optional<std::size_t> positionOf(PlayerId playerId) const;

    void publishSize() const;

    QueueConfig config_;
    const ISeasonLookup& seasons_;
    RankingService& rankings_;
    MatchLifecycle& matches_;
    foundation::ClockFn clock_;
    std::vector<QueueEntry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace arena::service
