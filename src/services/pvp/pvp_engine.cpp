/// @file pvp_engine.cpp
/// @brief PvpEngine implementation wiring queue, matches, spectators
///        and rankings together.

#include "arena/service/pvp_engine.hpp"

#include <utility>

#include "arena/foundation/arena_logger.hpp"
#include "arena/service/match_lifecycle.hpp"
#include "arena/service/matchmaking_queue.hpp"
#include "arena/service/ranking_service.hpp"
#include "arena/service/spectator_registry.hpp"

namespace arena::service {

using foundation::ErrorCode;
using foundation::LogCategory;

// -- Impl ---------------------------------------------------------------------

struct PvpEngine::Impl {
    EngineConfig config;
    std::shared_ptr<IPvpStore> store;
    std::shared_ptr<const ISeasonLookup> seasons;

    RankingService rankings;
    MatchLifecycle matches;
    SpectatorRegistry spectators;
    MatchmakingQueue queue;

    Impl(EngineConfig cfg, std::shared_ptr<IPvpStore> st,
         std::shared_ptr<const ISeasonLookup> sl, foundation::ClockFn clock)
        : config(std::move(cfg))
        , store(std::move(st))
        , seasons(std::move(sl))
        , rankings(*store, config.initialRating)
        , matches(*store, rankings, clock)
        , spectators(*store, matches, clock)
        , queue(config.queue, *seasons, rankings, matches, std::move(clock)) {}

    /// Attach both players' ratings in the match's season.
    ArenaResult<MatchView> view(Match match) const {
        auto ratingA = rankings.currentRating(match.playerAId, match.seasonId);
        if (!ratingA) {
            return ArenaResult<MatchView>::err(ratingA.error());
        }
        auto ratingB = rankings.currentRating(match.playerBId, match.seasonId);
        if (!ratingB) {
            return ArenaResult<MatchView>::err(ratingB.error());
        }
        return ArenaResult<MatchView>::ok(
            MatchView{std::move(match), ratingA.value(), ratingB.value()});
    }
};

// -- Construction / destruction / move ----------------------------------------

PvpEngine::PvpEngine(EngineConfig config,
                     std::shared_ptr<IPvpStore> store,
                     std::shared_ptr<const ISeasonLookup> seasons,
                     foundation::ClockFn clock)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(store),
                                   std::move(seasons), std::move(clock))) {
    ARENA_LOG_INFO(LogCategory::Core, "PVP engine initialized");
}

PvpEngine::~PvpEngine() = default;

PvpEngine::PvpEngine(PvpEngine&&) noexcept = default;
PvpEngine& PvpEngine::operator=(PvpEngine&&) noexcept = default;

// -- Matchmaking --------------------------------------------------------------

ArenaResult<JoinQueueResult> PvpEngine::joinQueue(
    PlayerId playerId, MatchType matchType, std::optional<int32_t> ratingRange) {
    return impl_->queue.joinQueue(playerId, matchType, ratingRange);
}

CancelQueueResult PvpEngine::cancelQueue(PlayerId playerId) {
    return impl_->queue.cancelQueue(playerId);
}

std::vector<QueueEntry> PvpEngine::queueSnapshot() const {
    return impl_->queue.snapshot();
}

// -- Matches ------------------------------------------------------------------

ArenaResult<MatchView> PvpEngine::getMatch(MatchId matchId) const {
    auto match = impl_->matches.getMatch(matchId);
    if (!match) {
        return ArenaResult<MatchView>::err(match.error());
    }
    return impl_->view(std::move(match).value());
}

ArenaResult<StartMatchResult> PvpEngine::startMatch(MatchId matchId) {
    return impl_->matches.startMatch(matchId);
}

ArenaResult<SubmitResultOutcome> PvpEngine::submitResult(
    MatchId matchId, std::optional<PlayerId> winnerId,
    int32_t scoreA, int32_t scoreB,
    int32_t movesA, int32_t movesB) {
    return impl_->matches.submitResult(matchId, winnerId, scoreA, scoreB, movesA, movesB);
}

ArenaResult<std::vector<MatchView>> PvpEngine::activeMatches(
    std::optional<std::size_t> limit) const {
    auto open = impl_->matches.openMatches(limit.value_or(impl_->config.activeMatchLimit));
    if (!open) {
        return ArenaResult<std::vector<MatchView>>::err(open.error());
    }

    std::vector<MatchView> views;
    views.reserve(open.value().size());
    for (auto& match : open.value()) {
        auto view = impl_->view(std::move(match));
        if (!view) {
            return ArenaResult<std::vector<MatchView>>::err(view.error());
        }
        views.push_back(std::move(view).value());
    }
    return ArenaResult<std::vector<MatchView>>::ok(std::move(views));
}

ArenaResult<std::vector<MatchHistoryEntry>> PvpEngine::playerMatchHistory(
    PlayerId playerId, std::optional<std::size_t> limit) const {
    return impl_->matches.playerHistory(playerId,
                                        limit.value_or(impl_->config.historyLimit));
}

// -- Spectators ---------------------------------------------------------------

ArenaResult<JoinSpectateResult> PvpEngine::joinSpectate(MatchId matchId, PlayerId playerId) {
    return impl_->spectators.joinSpectate(matchId, playerId);
}

ArenaResult<LeaveSpectateStatus> PvpEngine::leaveSpectate(SpectatorId spectatorId) {
    return impl_->spectators.leaveSpectate(spectatorId);
}

ArenaResult<std::vector<SpectatorRecord>> PvpEngine::listSpectators(MatchId matchId) const {
    return impl_->spectators.listSpectators(matchId);
}

ArenaResult<Match> PvpEngine::setAllowSpectate(MatchId matchId, bool allow) {
    return impl_->spectators.setAllowSpectate(matchId, allow);
}

// -- Rankings -----------------------------------------------------------------

ArenaResult<RankingInfo> PvpEngine::getPlayerRanking(
    PlayerId playerId, std::optional<SeasonId> seasonId) const {
    if (!seasonId.has_value()) {
        auto active = impl_->seasons->activeSeason();
        if (!active) {
            return ArenaResult<RankingInfo>::err(active.error());
        }
        seasonId = active.value();
    }
    return impl_->rankings.rankingInfo(playerId, *seasonId);
}

ArenaResult<std::vector<RankingInfo>> PvpEngine::getRankingList(
    std::optional<SeasonId> seasonId, std::optional<std::size_t> limit,
    std::size_t offset) const {
    if (!seasonId.has_value()) {
        auto active = impl_->seasons->activeSeason();
        if (!active) {
            if (active.error().code() == ErrorCode::NoActiveSeason) {
                return ArenaResult<std::vector<RankingInfo>>::ok({});
            }
            return ArenaResult<std::vector<RankingInfo>>::err(active.error());
        }
        seasonId = active.value();
    }
    return impl_->rankings.rankingList(
        *seasonId, limit.value_or(impl_->config.rankingListLimit), offset);
}

// -- Introspection ------------------------------------------------------------

EngineStats PvpEngine::stats() const {
    EngineStats stats;
    stats.queuedPlayers = impl_->queue.queueSize();
    stats.matchesCreated = impl_->matches.matchesCreated();
    stats.matchesFinished = impl_->matches.matchesFinished();
    stats.activeSpectators = impl_->spectators.activeCount();
    return stats;
}

const EngineConfig& PvpEngine::config() const noexcept {
    return impl_->config;
}

} // namespace arena::service
