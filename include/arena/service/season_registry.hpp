#pragma once

/// @file season_registry.hpp
/// @brief Rating season lookup and season lifecycle management.
///
/// ISeasonLookup is the only view of seasons the matchmaking and rating
/// components depend on. SeasonRegistry implements it in memory and adds
/// season creation, activation, ending and status queries.

#include "arena/foundation/arena_result.hpp"
#include "arena/service/pvp_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena::service {

using foundation::ArenaResult;

/// Read-only active season lookup.
class ISeasonLookup {
public:
    virtual ~ISeasonLookup() = default;

    /// The currently active season, or a NoActiveSeason error.
    [[nodiscard]] virtual ArenaResult<SeasonId> activeSeason() const = 0;
};

/// Thread-safe in-memory season registry.
///
/// At most one season is active at a time: activating a season
/// deactivates every other one.
///
/// @code
///   SeasonRegistry seasons;
///   auto s1 = seasons.createSeason("Season 1", 1, SeasonType::Regular, start, end);
///   seasons.activateSeason(s1.value().seasonId);
///   auto active = seasons.activeSeason();  // s1
/// @endcode
class SeasonRegistry : public ISeasonLookup {
public:
    explicit SeasonRegistry(foundation::ClockFn clock = foundation::systemClock());

    [[nodiscard]] ArenaResult<SeasonId> activeSeason() const override;

    /// Create an inactive season.
    ///
    /// @return InvalidSeason if @p endTime is not after @p startTime.
    [[nodiscard]] ArenaResult<Season> createSeason(
        std::string name, uint32_t number, SeasonType type,
        Timestamp startTime, Timestamp endTime);

    /// Activate a season, deactivating all others.
    [[nodiscard]] ArenaResult<Season> activateSeason(SeasonId seasonId);

    /// Close a season. Its rankings stay queryable by id.
    [[nodiscard]] ArenaResult<Season> endSeason(SeasonId seasonId);

    [[nodiscard]] std::optional<Season> getSeason(SeasonId seasonId) const;

    /// Seasons ordered by season number, newest first.
    [[nodiscard]] std::vector<Season> listSeasons(std::size_t limit = 10) const;

    /// Time-window status of a season at the registry clock's current time.
    [[nodiscard]] ArenaResult<SeasonState> seasonStatus(SeasonId seasonId) const;

    /// Status at an explicit instant; the time window is checked before the active flag.
    [[nodiscard]] static SeasonState stateAt(const Season& season, Timestamp now);

private:
    foundation::ClockFn clock_;
    std::unordered_map<SeasonId, Season> seasons_;
    std::optional<SeasonId> active_;
    uint64_t nextSeasonId_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace arena::service
