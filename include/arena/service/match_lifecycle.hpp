#pragma once

/// @file match_lifecycle.hpp
/// @brief Match state machine: creation, start, result submission.
///
/// @code
///   WAITING --startMatch()--> ACTIVE --submitResult()--> FINISHED
/// @endcode
///
/// Every transition runs under the match's own mutex, so the status check
/// and the status write behave as one compare-and-swap: of two concurrent
/// submissions for the same match exactly one succeeds and the other gets
/// InvalidStatus. Unrelated matches never contend.

#include "arena/foundation/arena_result.hpp"
#include "arena/foundation/keyed_mutex.hpp"
#include "arena/service/pvp_store.hpp"
#include "arena/service/pvp_types.hpp"
#include "arena/service/ranking_service.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace arena::service {

/// In-place edit of a match performed under its lock. Returning an error
/// aborts the edit and nothing is written.
using MatchMutator = std::function<ArenaResult<void>(Match&)>;

class MatchLifecycle {
public:
    MatchLifecycle(IPvpStore& store, RankingService& rankings,
                   foundation::ClockFn clock = foundation::systemClock());

    /// Create a Waiting match between two distinct players.
    ///
    /// The ratings are the ones matchmaking paired on; they are logged, not stored.
    [[nodiscard]] ArenaResult<Match> createMatch(
        PlayerId playerA, PlayerId playerB,
        int32_t ratingA, int32_t ratingB,
        MatchType matchType, SeasonId seasonId);

    /// Current snapshot. MatchNotFound if unknown.
    [[nodiscard]] ArenaResult<Match> getMatch(MatchId matchId) const;

    /// Waiting -> Active. InvalidStatus from any other state.
    [[nodiscard]] ArenaResult<StartMatchResult> startMatch(MatchId matchId);

    /// Active -> Finished and rating application.
    ///
    /// @param winnerId  One of the two players, or nullopt for a draw.
    /// @return MatchNotFound, InvalidStatus (not Active), InvalidWinner, or
    ///         any store error. On error neither the match nor the rankings
    ///         change.
    [[nodiscard]] ArenaResult<SubmitResultOutcome> submitResult(
        MatchId matchId, std::optional<PlayerId> winnerId,
        int32_t scoreA, int32_t scoreB,
        int32_t movesA = 0, int32_t movesB = 0);

    /// Load, edit and save a match under its lock.
    [[nodiscard]] ArenaResult<Match> modifyMatch(MatchId matchId, const MatchMutator& mutator);

    /// Waiting/Active matches, newest first.
    [[nodiscard]] ArenaResult<std::vector<Match>> openMatches(std::size_t limit) const;

    /// Finished matches of a player from that player's side, newest first.
    [[nodiscard]] ArenaResult<std::vector<MatchHistoryEntry>> playerHistory(
        PlayerId playerId, std::size_t limit) const;

    [[nodiscard]] uint64_t matchesCreated() const noexcept;
    [[nodiscard]] uint64_t matchesFinished() const noexcept;

private:
    [[nodiscard]] MatchId nextMatchId();

    IPvpStore& store_;
    RankingService& rankings_;
    foundation::ClockFn clock_;
    foundation::KeyedMutex<MatchId> locks_;
    std::atomic<uint64_t> nextMatchId_{1};
    std::atomic<uint64_t> matchesCreated_{0};
    std::atomic<uint64_t> matchesFinished_{0};
};

}  // namespace arena::service
