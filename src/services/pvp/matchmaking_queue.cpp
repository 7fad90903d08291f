/// @file matchmaking_queue.cpp
/// @brief MatchmakingQueue implementation.

#include "arena/service/matchmaking_queue.hpp"

#include "arena/foundation/arena_logger.hpp"
#include "arena/foundation/arena_metrics.hpp"
#include "arena/service/elo_calculator.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace arena::service {

using foundation::ArenaMetrics;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

MatchmakingQueue::MatchmakingQueue(QueueConfig config,
                                   const ISeasonLookup& seasons,
                                   RankingService& rankings,
                                   MatchLifecycle& matches,
                                   foundation::ClockFn clock)
    : config_(std::move(config)),
      seasons_(seasons),
      rankings_(rankings),
      matches_(matches),
      clock_(std::move(clock)) {}

ArenaResult<JoinQueueResult> MatchmakingQueue::joinQueue(
    PlayerId playerId, MatchType matchType, std::optional<int32_t> ratingRange) {
    std::lock_guard lock(mutex_);

    auto season = seasons_.activeSeason();
    if (!season) {
        return ArenaResult<JoinQueueResult>::err(season.error());
    }

    if (auto position = positionOf(playerId)) {
        AlreadyQueuedResult already{playerId, *position + 1};
        return ArenaResult<JoinQueueResult>::ok(JoinQueueResult{already});
    }

    auto rating = rankings_.currentRating(playerId, season.value());
    if (!rating) {
        return ArenaResult<JoinQueueResult>::err(rating.error());
    }

    QueueEntry requester;
    requester.playerId = playerId;
    requester.rating = rating.value();
    requester.queuedAt = clock_();
    requester.matchType = matchType;
    requester.ratingRange = ratingRange.value_or(config_.defaultRatingRange);

    ArenaMetrics::instance().incrementCounter(foundation::metric::kQueueJoins);

    LogContext ctx;
    ctx.playerId = playerId;
    ctx.seasonId = season.value();
    ctx.extra["type"] = std::string(matchTypeName(matchType));
    ctx.extra["rating"] = std::to_string(requester.rating);

    if (auto index = findOpponent(requester)) {
        const QueueEntry& opponent = entries_[*index];
        auto created = matches_.createMatch(
            requester.playerId, opponent.playerId,
            requester.rating, opponent.rating,
            matchType, season.value());
        if (!created) {
            // The opponent keeps its place; nothing was consumed.
            return ArenaResult<JoinQueueResult>::err(created.error());
        }

        MatchedResult matched;
        matched.match = std::move(created).value();
        matched.playerARating = requester.rating;
        matched.playerBRating = opponent.rating;

        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*index));
        publishSize();

        ctx.matchId = matched.match.matchId;
        ctx.extra["opponent"] = std::to_string(matched.match.playerBId.value());
        ARENA_LOG_CTX(LogLevel::Info, LogCategory::Queue, "Player matched from queue", ctx);
        return ArenaResult<JoinQueueResult>::ok(JoinQueueResult{std::move(matched)});
    }

    entries_.push_back(requester);
    publishSize();

    QueuedResult queued;
    queued.playerId = playerId;
    queued.rating = requester.rating;
    queued.queuePosition = entries_.size();
    queued.estimatedWait = config_.waitPerEntry * static_cast<int64_t>(entries_.size());

    ctx.extra["position"] = std::to_string(queued.queuePosition);
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Queue, "Player queued", ctx);
    return ArenaResult<JoinQueueResult>::ok(JoinQueueResult{queued});
}

CancelQueueResult MatchmakingQueue::cancelQueue(PlayerId playerId) {
    std::lock_guard lock(mutex_);

    auto position = positionOf(playerId);
    if (!position) {
        return CancelQueueResult{CancelQueueStatus::NotQueued, playerId};
    }

    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*position));
    publishSize();
    ArenaMetrics::instance().incrementCounter(foundation::metric::kQueueCancels);

    LogContext ctx;
    ctx.playerId = playerId;
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Queue, "Player left queue", ctx);
    return CancelQueueResult{CancelQueueStatus::Cancelled, playerId};
}

bool MatchmakingQueue::isQueued(PlayerId playerId) const {
    std::lock_guard lock(mutex_);
    return positionOf(playerId).has_value();
}

std::size_t MatchmakingQueue::queueSize() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::vector<QueueEntry> MatchmakingQueue::snapshot() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

const QueueConfig& MatchmakingQueue::config() const noexcept {
    return config_;
}

// -- Private helpers (caller holds mutex_) ------------------------------------

std::optional<std::size_t> MatchmakingQueue::findOpponent(const QueueEntry& requester) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& candidate = entries_[i];
        if (candidate.playerId == requester.playerId) {
            continue;
        }
        if (candidate.matchType != requester.matchType) {
            continue;
        }
        if (EloCalculator::isWithinRange(candidate.rating, requester.rating,
                                         requester.ratingRange)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> MatchmakingQueue::positionOf(PlayerId playerId) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [playerId](const QueueEntry& entry) {
                               return entry.playerId == playerId;
                           });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - entries_.begin());
}

void MatchmakingQueue::publishSize() const {
    ArenaMetrics::instance().setGauge(foundation::metric::kQueueSize,
                                      static_cast<double>(entries_.size()));
}

} // namespace arena::service
