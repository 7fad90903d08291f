#pragma once

/// @file pvp_store.hpp
/// @brief Persistence interface for matches, rankings and spectators, and
///        its in-memory implementation.
///
/// The engine performs every read and write through IPvpStore; it assumes
/// only atomic read-modify-write per entity, never a wider transaction.

#include "arena/foundation/arena_result.hpp"
#include "arena/service/pvp_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arena::service {

using foundation::ArenaResult;

/// Abstract persistence contract.
///
/// Implementations must be thread-safe. Infrastructure failures are
/// reported as StoreUnavailable / StoreWriteFailed errors and passed
/// through by the engine unchanged.
class IPvpStore {
public:
    virtual ~IPvpStore() = default;

    // -- Rankings -------------------------------------------------------------

    [[nodiscard]] virtual ArenaResult<std::optional<PlayerRanking>> loadRanking(
        PlayerId playerId, SeasonId seasonId) const = 0;

    [[nodiscard]] virtual ArenaResult<void> saveRanking(const PlayerRanking& ranking) = 0;

    /// Rankings of a season ordered by rating descending (ties by player id).
    [[nodiscard]] virtual ArenaResult<std::vector<PlayerRanking>> rankingsForSeason(
        SeasonId seasonId, std::size_t limit, std::size_t offset) const = 0;

    /// Number of rankings in the season with a rating strictly above @p rating.
    [[nodiscard]] virtual ArenaResult<std::size_t> countRatingsAbove(
        SeasonId seasonId, int32_t rating) const = 0;

    // -- Matches --------------------------------------------------------------

    [[nodiscard]] virtual ArenaResult<std::optional<Match>> loadMatch(MatchId matchId) const = 0;

    [[nodiscard]] virtual ArenaResult<void> saveMatch(const Match& match) = 0;

    /// Waiting and Active matches, newest first.
    [[nodiscard]] virtual ArenaResult<std::vector<Match>> openMatches(std::size_t limit) const = 0;

    /// Finished matches a player took part in, most recently finished first.
    [[nodiscard]] virtual ArenaResult<std::vector<Match>> finishedMatchesFor(
        PlayerId playerId, std::size_t limit) const = 0;

    // -- Spectators -----------------------------------------------------------

    [[nodiscard]] virtual ArenaResult<std::optional<SpectatorRecord>> loadSpectator(
        SpectatorId spectatorId) const = 0;

    [[nodiscard]] virtual ArenaResult<void> saveSpectatorRecord(const SpectatorRecord& record) = 0;

    /// The player's record for the match that has not been left, if any.
    [[nodiscard]] virtual ArenaResult<std::optional<SpectatorRecord>> findActiveSpectator(
        MatchId matchId, PlayerId playerId) const = 0;

    /// All records of the match that have not been left, in join order.
    [[nodiscard]] virtual ArenaResult<std::vector<SpectatorRecord>> activeSpectators(
        MatchId matchId) const = 0;
};

/// Thread-safe in-memory store for tests and single-process deployments.
class InMemoryPvpStore : public IPvpStore {
public:
    [[nodiscard]] ArenaResult<std::optional<PlayerRanking>> loadRanking(
        PlayerId playerId, SeasonId seasonId) const override;

    [[nodiscard]] ArenaResult<void> saveRanking(const PlayerRanking& ranking) override;

    [[nodiscard]] ArenaResult<std::vector<PlayerRanking>> rankingsForSeason(
        SeasonId seasonId, std::size_t limit, std::size_t offset) const override;

    [[nodiscard]] ArenaResult<std::size_t> countRatingsAbove(
        SeasonId seasonId, int32_t rating) const override;

    [[nodiscard]] ArenaResult<std::optional<Match>> loadMatch(MatchId matchId) const override;

    [[nodiscard]] ArenaResult<void> saveMatch(const Match& match) override;

    [[nodiscard]] ArenaResult<std::vector<Match>> openMatches(std::size_t limit) const override;

    [[nodiscard]] ArenaResult<std::vector<Match>> finishedMatchesFor(
        PlayerId playerId, std::size_t limit) const override;

    [[nodiscard]] ArenaResult<std::optional<SpectatorRecord>> loadSpectator(
        SpectatorId spectatorId) const override;

    [[nodiscard]] ArenaResult<void> saveSpectatorRecord(const SpectatorRecord& record) override;

    [[nodiscard]] ArenaResult<std::optional<SpectatorRecord>> findActiveSpectator(
        MatchId matchId, PlayerId playerId) const override;

    [[nodiscard]] ArenaResult<std::vector<SpectatorRecord>> activeSpectators(
        MatchId matchId) const override;

    [[nodiscard]] std::size_t rankingCount() const;
    [[nodiscard]] std::size_t matchCount() const;

private:
    using RankingKey = std::pair<uint64_t, uint64_t>;  // (season, player)

    mutable std::mutex mutex_;
    std::map<RankingKey, PlayerRanking> rankings_;
    std::unordered_map<MatchId, Match> matches_;
    std::map<SpectatorId, SpectatorRecord> spectators_;  // ordered by id = join order
};

}  // namespace arena::service
