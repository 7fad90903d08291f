#pragma once

/// @file pvp_engine.hpp
/// @brief PVP engine facade: matchmaking, match lifecycle, spectators
///        and per-season rankings behind one entry point.
///
/// PvpEngine owns the queue, the match state machine, the spectator
/// registry and the ranking service, wired to a shared IPvpStore and an
/// ISeasonLookup. All operations are synchronous and safe to call from
/// many threads.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "arena/foundation/arena_result.hpp"
#include "arena/service/pvp_store.hpp"
#include "arena/service/pvp_types.hpp"
#include "arena/service/season_registry.hpp"

namespace arena::service {

/// PVP engine facade.
///
/// Usage:
/// @code
///   auto store = std::make_shared<InMemoryPvpStore>();
///   auto seasons = std::make_shared<SeasonRegistry>();
///   PvpEngine engine(EngineConfig{}, store, seasons);
///
///   engine.joinQueue(PlayerId(1));
///   auto joined = engine.joinQueue(PlayerId(2));        // Matched
///   auto& match = std::get<MatchedResult>(joined.value()).match;
///
///   engine.startMatch(match.matchId);
///   engine.submitResult(match.matchId, PlayerId(2), 3, 1);
/// @endcode
class PvpEngine {
public:
    PvpEngine(EngineConfig config,
              std::shared_ptr<IPvpStore> store,
              std::shared_ptr<const ISeasonLookup> seasons,
              foundation::ClockFn clock = foundation::systemClock());
    ~PvpEngine();

    PvpEngine(const PvpEngine&) = delete;
    PvpEngine& operator=(const PvpEngine&) = delete;
    PvpEngine(PvpEngine&&) noexcept;
    PvpEngine& operator=(PvpEngine&&) noexcept;

    // -- Matchmaking ----------------------------------------------------------

    /// Join the queue for @p matchType, or get matched at once.
    ///
    /// @param ratingRange  Accepted rating gap; the configured default when empty.
    [[nodiscard]] ArenaResult<JoinQueueResult> joinQueue(
        PlayerId playerId,
        MatchType matchType = MatchType::Arena,
        std::optional<int32_t> ratingRange = std::nullopt);

    [[nodiscard]] CancelQueueResult cancelQueue(PlayerId playerId);

    /// Queue entries in queue order.
    [[nodiscard]] std::vector<QueueEntry> queueSnapshot() const;

    // -- Matches --------------------------------------------------------------

    /// Match with both players' current ratings in the match's season.
    [[nodiscard]] ArenaResult<MatchView> getMatch(MatchId matchId) const;

    [[nodiscard]] ArenaResult<StartMatchResult> startMatch(MatchId matchId);

    /// Finish a match and apply ratings. @p winnerId empty means a draw.
    [[nodiscard]] ArenaResult<SubmitResultOutcome> submitResult(
        MatchId matchId, std::optional<PlayerId> winnerId,
        int32_t scoreA, int32_t scoreB,
        int32_t movesA = 0, int32_t movesB = 0);

    /// Waiting and Active matches, newest first.
    [[nodiscard]] ArenaResult<std::vector<MatchView>> activeMatches(
        std::optional<std::size_t> limit = std::nullopt) const;

    /// Finished matches of a player, newest first.
    [[nodiscard]] ArenaResult<std::vector<MatchHistoryEntry>> playerMatchHistory(
        PlayerId playerId, std::optional<std::size_t> limit = std::nullopt) const;

    // -- Spectators -----------------------------------------------------------

    [[nodiscard]] ArenaResult<JoinSpectateResult> joinSpectate(MatchId matchId, PlayerId playerId);

    [[nodiscard]] ArenaResult<LeaveSpectateStatus> leaveSpectate(SpectatorId spectatorId);

    [[nodiscard]] ArenaResult<std::vector<SpectatorRecord>> listSpectators(MatchId matchId) const;

    [[nodiscard]] ArenaResult<Match> setAllowSpectate(MatchId matchId, bool allow);

    // -- Rankings -------------------------------------------------------------

    /// Ranking with rank and win rate.
    ///
    /// @param seasonId  Defaults to the active season (NoActiveSeason if none).
    /// @return RankingNotFound if the player has no row; none is created.
    [[nodiscard]] ArenaResult<RankingInfo> getPlayerRanking(
        PlayerId playerId, std::optional<SeasonId> seasonId = std::nullopt) const;

    /// Leaderboard page. Empty when @p seasonId is omitted and no season is active.
    [[nodiscard]] ArenaResult<std::vector<RankingInfo>> getRankingList(
        std::optional<SeasonId> seasonId = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt,
        std::size_t offset = 0) const;

    // -- Introspection --------------------------------------------------------

    [[nodiscard]] EngineStats stats() const;

    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace arena::service
