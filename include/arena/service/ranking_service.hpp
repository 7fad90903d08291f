#pragma once

/// @file ranking_service.hpp
/// @brief Per-season player rankings: lazy creation, Elo application,
///        rank and leaderboard queries.

#include "arena/foundation/arena_result.hpp"
#include "arena/foundation/keyed_mutex.hpp"
#include "arena/service/pvp_store.hpp"
#include "arena/service/pvp_types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace arena::service {

/// Rating changes produced by one finished match, together with the
/// rankings as they were before it.
struct RatingUpdate {
    RatingChange playerA;
    RatingChange playerB;
    PlayerRanking previousA;
    PlayerRanking previousB;
};

/// Thread-safe ranking service over an IPvpStore.
///
/// Each (player, season) ranking is guarded by its own mutex; applying a
/// match result locks both players' mutexes together.
class RankingService {
public:
    explicit RankingService(IPvpStore& store, int32_t initialRating = kInitialRating);

    /// Ranking row, or nullopt if the player has not played this season.
    [[nodiscard]] ArenaResult<std::optional<PlayerRanking>> findRanking(
        PlayerId playerId, SeasonId seasonId) const;

    /// Current rating; the initial rating when no row exists. Never creates a row.
    [[nodiscard]] ArenaResult<int32_t> currentRating(PlayerId playerId, SeasonId seasonId) const;

    /// Ranking row, created with the initial rating on first access.
    [[nodiscard]] ArenaResult<PlayerRanking> getOrCreate(PlayerId playerId, SeasonId seasonId);

    /// Runs after both rankings are written, with both still locked.
    using RatingCommit = std::function<ArenaResult<void>(const RatingUpdate&)>;

    /// Apply one match outcome to both players' rankings in @p seasonId.
    ///
    /// Expected scores come from the pre-match ratings; each side's K-factor
    /// from its own rating and experience. Counters, max rating and streaks
    /// are updated in the same write.
    ///
    /// If @p commit fails, the pre-match rows are written back before the
    /// locks are released and its error is returned.
    [[nodiscard]] ArenaResult<RatingUpdate> applyResult(
        SeasonId seasonId, PlayerId playerA, PlayerId playerB, MatchOutcome outcome,
        const RatingCommit& commit = {});

    /// 1-based rank: players in the season with a strictly higher rating, plus one.
    [[nodiscard]] ArenaResult<uint32_t> rank(PlayerId playerId, SeasonId seasonId) const;

    /// Ranking row with rank and win rate. RankingNotFound if no row exists.
    [[nodiscard]] ArenaResult<RankingInfo> rankingInfo(PlayerId playerId, SeasonId seasonId) const;

    /// Leaderboard page ordered by rating descending; rank = offset + index + 1.
    [[nodiscard]] ArenaResult<std::vector<RankingInfo>> rankingList(
        SeasonId seasonId, std::size_t limit, std::size_t offset) const;

    /// Win percentage rounded to two decimals; 0 for a player with no matches.
    [[nodiscard]] static double winRate(const PlayerRanking& ranking);

    [[nodiscard]] int32_t initialRating() const noexcept { return initialRating_; }

    /// Update counters and streaks for one side of a finished match.
    static void recordResult(PlayerRanking& ranking, double actual, int32_t newRating);

private:
    struct RankingKey {
        PlayerId playerId;
        SeasonId seasonId;

        bool operator==(const RankingKey&) const = default;
    };

    struct RankingKeyHash {
        std::size_t operator()(const RankingKey& key) const noexcept {
            return std::hash<PlayerId>{}(key.playerId) ^
                   (std::hash<SeasonId>{}(key.seasonId) << 1);
        }
    };

    /// Load-or-create without taking the per-key lock (caller holds it).
    [[nodiscard]] ArenaResult<PlayerRanking> loadOrCreateLocked(
        PlayerId playerId, SeasonId seasonId);

    /// Write back both pre-match rows. Caller holds both per-key locks.
    void restoreLocked(const RatingUpdate& update);

    [[nodiscard]] ArenaResult<uint32_t> rankForRating(SeasonId seasonId, int32_t rating) const;

    IPvpStore& store_;
    int32_t initialRating_;
    foundation::KeyedMutex<RankingKey, RankingKeyHash> locks_;
};

}  // namespace arena::service
