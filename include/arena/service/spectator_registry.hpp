#pragma once

/// @file spectator_registry.hpp
/// @brief Spectator membership for matches.
///
/// Membership changes run under the match's lock (via
/// MatchLifecycle::modifyMatch) so the spectator count stored on the match
/// always equals the number of active records.

#include "arena/foundation/arena_result.hpp"
#include "arena/service/match_lifecycle.hpp"
#include "arena/service/pvp_store.hpp"
#include "arena/service/pvp_types.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace arena::service {

class SpectatorRegistry {
public:
    SpectatorRegistry(IPvpStore& store, MatchLifecycle& matches,
                      foundation::ClockFn clock = foundation::systemClock());

    /// Start watching a match.
    ///
    /// Checked in order: MatchNotFound, SpectateNotAllowed, InvalidStatus
    /// (finished match). A player already watching gets AlreadySpectating
    /// with the existing record id.
    [[nodiscard]] ArenaResult<JoinSpectateResult> joinSpectate(MatchId matchId, PlayerId playerId);

    /// Stop watching. NotSpectating if the record is unknown or already left.
    [[nodiscard]] ArenaResult<LeaveSpectateStatus> leaveSpectate(SpectatorId spectatorId);

    /// Active records of a match in join order.
    [[nodiscard]] ArenaResult<std::vector<SpectatorRecord>> listSpectators(MatchId matchId) const;

    /// Open or close a match to spectators. InvalidStatus once finished.
    [[nodiscard]] ArenaResult<Match> setAllowSpectate(MatchId matchId, bool allow);

    /// Active spectators across all matches.
    [[nodiscard]] uint64_t activeCount() const noexcept;

private:
    IPvpStore& store_;
    MatchLifecycle& matches_;
    foundation::ClockFn clock_;
    std::atomic<uint64_t> nextSpectatorId_{1};
    std::atomic<uint64_t> active_{0};
};

}  // namespace arena::service
