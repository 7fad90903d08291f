#pragma once

/// @file pvp_types.hpp
/// @brief Core types for the PVP matchmaking and rating engine.
///
/// Defines match types and statuses, queue entries, matches, per-season
/// rankings, spectator records, seasons, and the result structs returned
/// by each engine operation.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "arena/foundation/types.hpp"

namespace arena::service {

using foundation::MatchId;
using foundation::PlayerId;
using foundation::SeasonId;
using foundation::SpectatorId;
using foundation::Timestamp;

/// Rating every player starts a season with.
inline constexpr int32_t kInitialRating = 1000;

/// Queue families. Players are only matched within the same type.
enum class MatchType : uint8_t {
    Arena,      ///< Ranked arena (default queue).
    Duel,       ///< Challenge duel.
    Tournament, ///< Tournament bracket game.
    Friendly    ///< Unranked friendly.
};

/// Match lifecycle states. Transitions are strictly forward.
enum class MatchStatus : uint8_t {
    Waiting,  ///< Created by matchmaking, not yet started.
    Active,   ///< In progress.
    Finished  ///< Result submitted; immutable.
};

constexpr std::string_view matchTypeName(MatchType type) {
    switch (type) {
        case MatchType::Arena:      return "arena";
        case MatchType::Duel:       return "duel";
        case MatchType::Tournament: return "tournament";
        case MatchType::Friendly:   return "friendly";
    }
    return "unknown";
}

constexpr std::string_view matchStatusName(MatchStatus status) {
    switch (status) {
        case MatchStatus::Waiting:  return "waiting";
        case MatchStatus::Active:   return "active";
        case MatchStatus::Finished: return "finished";
    }
    return "unknown";
}

/// Parse a wire-format match type ("arena", "duel", ...).
constexpr std::optional<MatchType> parseMatchType(std::string_view name) {
    for (auto type : {MatchType::Arena, MatchType::Duel,
                      MatchType::Tournament, MatchType::Friendly}) {
        if (matchTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

// -- Queue --------------------------------------------------------------------

/// A waiting player. Owned exclusively by MatchmakingQueue.
struct QueueEntry {
    PlayerId playerId;
    int32_t rating = kInitialRating;
    Timestamp queuedAt{};
    MatchType matchType = MatchType::Arena;
    int32_t ratingRange = 200;  ///< Max accepted |opponent - own| rating gap.
};

// -- Match --------------------------------------------------------------------

struct Match {
    MatchId matchId;
    SeasonId seasonId;  ///< Season whose rankings this match updates.
    MatchType matchType = MatchType::Arena;
    PlayerId playerAId;
    PlayerId playerBId;
    MatchStatus status = MatchStatus::Waiting;
    int32_t scoreA = 0;
    int32_t scoreB = 0;
    std::optional<PlayerId> winnerId;  ///< Empty on a draw or while unfinished.
    int32_t movesA = 0;
    int32_t movesB = 0;
    int64_t durationSeconds = 0;
    uint32_t spectatorCount = 0;
    bool allowSpectate = true;
    Timestamp createdAt{};
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> finishedAt;

    [[nodiscard]] bool hasPlayer(PlayerId id) const noexcept {
        return id == playerAId || id == playerBId;
    }
};

/// Match plus the players' current ratings, as returned by getMatch().
struct MatchView {
    Match match;
    int32_t playerARating = kInitialRating;
    int32_t playerBRating = kInitialRating;
};

/// One finished match seen from a single player's side.
struct MatchHistoryEntry {
    MatchId matchId;
    MatchType matchType = MatchType::Arena;
    PlayerId opponentId;
    int32_t playerScore = 0;
    int32_t opponentScore = 0;
    bool isWinner = false;
    bool isDraw = false;
    std::optional<Timestamp> finishedAt;
};

// -- Ranking ------------------------------------------------------------------

/// Skill record keyed by (playerId, seasonId).
struct PlayerRanking {
    PlayerId playerId;
    SeasonId seasonId;
    int32_t rating = kInitialRating;
    int32_t maxRating = kInitialRating;
    uint32_t matchesPlayed = 0;
    uint32_t matchesWon = 0;
    uint32_t matchesLost = 0;
    uint32_t matchesDrawn = 0;
    int32_t currentStreak = 0;  ///< >0 win streak, <0 loss streak.
    int32_t maxStreak = 0;
};

/// Ranking row decorated with its leaderboard position.
struct RankingInfo {
    PlayerRanking ranking;
    uint32_t rank = 0;     ///< 1-based.
    double winRate = 0.0;  ///< Percentage, rounded to two decimals.
};

/// Outcome of a match from player A's point of view.
enum class MatchOutcome : uint8_t {
    PlayerAWins,
    PlayerBWins,
    Draw
};

// -- Spectators ---------------------------------------------------------------

struct SpectatorRecord {
    SpectatorId spectatorId;
    MatchId matchId;
    PlayerId playerId;
    Timestamp joinedAt{};
    std::optional<Timestamp> leftAt;  ///< Set when the spectator leaves.

    [[nodiscard]] bool isActive() const noexcept { return !leftAt.has_value(); }
};

// -- Seasons ------------------------------------------------------------------

enum class SeasonType : uint8_t {
    Regular,
    Special,
    Championship
};

/// Time-window state of a season, as reported by seasonStatus().
enum class SeasonState : uint8_t {
    Upcoming,  ///< Start time not reached.
    Active,    ///< Inside the window and flagged active.
    Inactive,  ///< Inside the window but not flagged active.
    Ended      ///< End time passed.
};

struct Season {
    SeasonId seasonId;
    std::string name;
    uint32_t number = 0;
    SeasonType type = SeasonType::Regular;
    Timestamp startTime{};
    Timestamp endTime{};
    bool isActive = false;
    Timestamp createdAt{};
};

// -- Operation results --------------------------------------------------------

/// Requester was appended to the queue.
struct QueuedResult {
    PlayerId playerId;
    int32_t rating = kInitialRating;
    std::size_t queuePosition = 0;  ///< 1-based.
    std::chrono::seconds estimatedWait{0};
};

/// Requester was paired with a waiting player.
struct MatchedResult {
    Match match;
    int32_t playerARating = kInitialRating;
    int32_t playerBRating = kInitialRating;
};

/// Requester already had a queue entry; nothing changed.
struct AlreadyQueuedResult {
    PlayerId playerId;
    std::size_t queuePosition = 0;  ///< 1-based.
};

using JoinQueueResult = std::variant<QueuedResult, MatchedResult, AlreadyQueuedResult>;

enum class JoinQueueStatus : uint8_t { Queued, Matched, AlreadyQueued };

/// Status tag of a JoinQueueResult.
constexpr JoinQueueStatus joinQueueStatus(const JoinQueueResult& result) {
    switch (result.index()) {
        case 0: return JoinQueueStatus::Queued;
        case 1: return JoinQueueStatus::Matched;
        default: return JoinQueueStatus::AlreadyQueued;
    }
}

enum class CancelQueueStatus : uint8_t { Cancelled, NotQueued };

struct CancelQueueResult {
    CancelQueueStatus status = CancelQueueStatus::NotQueued;
    PlayerId playerId;
};

struct StartMatchResult {
    MatchId matchId;
    MatchStatus status = MatchStatus::Active;
    Timestamp startedAt{};
};

struct RatingChange {
    PlayerId playerId;
    int32_t oldRating = 0;
    int32_t newRating = 0;

    [[nodiscard]] int32_t delta() const noexcept { return newRating - oldRating; }
};

struct SubmitResultOutcome {
    MatchId matchId;
    MatchStatus status = MatchStatus::Finished;
    std::optional<PlayerId> winnerId;
    int32_t scoreA = 0;
    int32_t scoreB = 0;
    int64_t durationSeconds = 0;
    RatingChange playerA;
    RatingChange playerB;
};

enum class SpectateStatus : uint8_t { Joined, AlreadySpectating };

struct JoinSpectateResult {
    SpectateStatus status = SpectateStatus::Joined;
    MatchId matchId;
    SpectatorId spectatorId;
    uint32_t spectatorCount = 0;
};

enum class LeaveSpectateStatus : uint8_t { Left, NotSpectating };

// -- Configuration and statistics --------------------------------------------

struct QueueConfig {
    int32_t defaultRatingRange = 200;
    std::chrono::seconds waitPerEntry{5};  ///< Wait estimate per queued player.
};

struct EngineConfig {
    QueueConfig queue;
    int32_t initialRating = kInitialRating;
    uint32_t rankingListLimit = 100;
    uint32_t activeMatchLimit = 50;
    uint32_t historyLimit = 20;
};

struct EngineStats {
    std::size_t queuedPlayers = 0;
    uint64_t matchesCreated = 0;
    uint64_t matchesFinished = 0;
    uint64_t activeSpectators = 0;
};

}  // namespace arena::service
