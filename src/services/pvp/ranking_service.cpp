/// @file ranking_service.cpp
/// @brief RankingService implementation.

#include "arena/service/ranking_service.hpp"

#include "arena/foundation/arena_logger.hpp"
#include "arena/service/elo_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <string>

namespace arena::service {

using foundation::ArenaError;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

RankingService::RankingService(IPvpStore& store, int32_t initialRating)
    : store_(store), initialRating_(initialRating) {}

ArenaResult<std::optional<PlayerRanking>> RankingService::findRanking(
    PlayerId playerId, SeasonId seasonId) const {
    return store_.loadRanking(playerId, seasonId);
}

ArenaResult<int32_t> RankingService::currentRating(PlayerId playerId, SeasonId seasonId) const {
    auto loaded = store_.loadRanking(playerId, seasonId);
    if (!loaded) {
        return ArenaResult<int32_t>::err(loaded.error());
    }
    const auto& ranking = loaded.value();
    return ArenaResult<int32_t>::ok(ranking ? ranking->rating : initialRating_);
}

ArenaResult<PlayerRanking> RankingService::getOrCreate(PlayerId playerId, SeasonId seasonId) {
    auto handle = locks_.get(RankingKey{playerId, seasonId});
    std::lock_guard lock(*handle);
    return loadOrCreateLocked(playerId, seasonId);
}

ArenaResult<PlayerRanking> RankingService::loadOrCreateLocked(
    PlayerId playerId, SeasonId seasonId) {
    auto loaded = store_.loadRanking(playerId, seasonId);
    if (!loaded) {
        return ArenaResult<PlayerRanking>::err(loaded.error());
    }
    if (loaded.value().has_value()) {
        return ArenaResult<PlayerRanking>::ok(*loaded.value());
    }

    PlayerRanking ranking;
    ranking.playerId = playerId;
    ranking.seasonId = seasonId;
    ranking.rating = initialRating_;
    ranking.maxRating = initialRating_;

    auto saved = store_.saveRanking(ranking);
    if (!saved) {
        return ArenaResult<PlayerRanking>::err(saved.error());
    }

    LogContext ctx;
    ctx.playerId = playerId;
    ctx.seasonId = seasonId;
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Rating, "Ranking created", ctx);
    return ArenaResult<PlayerRanking>::ok(std::move(ranking));
}

ArenaResult<RatingUpdate> RankingService::applyResult(
    SeasonId seasonId, PlayerId playerA, PlayerId playerB, MatchOutcome outcome,
    const RatingCommit& commit) {
    if (playerA == playerB) {
        return ArenaResult<RatingUpdate>::err(
            ArenaError(ErrorCode::InvalidArgument, "a player cannot be rated against themselves"));
    }

    auto handleA = locks_.get(RankingKey{playerA, seasonId});
    auto handleB = locks_.get(RankingKey{playerB, seasonId});
    std::scoped_lock lock(*handleA, *handleB);

    auto loadedA = loadOrCreateLocked(playerA, seasonId);
    if (!loadedA) {
        return ArenaResult<RatingUpdate>::err(loadedA.error());
    }
    auto loadedB = loadOrCreateLocked(playerB, seasonId);
    if (!loadedB) {
        return ArenaResult<RatingUpdate>::err(loadedB.error());
    }

    RatingUpdate update;
    update.previousA = loadedA.value();
    update.previousB = loadedB.value();

    PlayerRanking rankingA = update.previousA;
    PlayerRanking rankingB = update.previousB;

    auto expected = EloCalculator::expectedScore(rankingA.rating, rankingB.rating);
    auto actual = EloCalculator::actualScores(outcome);

    int32_t newA = EloCalculator::newRating(
        rankingA.rating, expected.a, actual.a, rankingA.matchesPlayed);
    int32_t newB = EloCalculator::newRating(
        rankingB.rating, expected.b, actual.b, rankingB.matchesPlayed);

    update.playerA = RatingChange{playerA, rankingA.rating, newA};
    update.playerB = RatingChange{playerB, rankingB.rating, newB};

    recordResult(rankingA, actual.a, newA);
    recordResult(rankingB, actual.b, newB);

    auto savedA = store_.saveRanking(rankingA);
    if (!savedA) {
        return ArenaResult<RatingUpdate>::err(savedA.error());
    }
    auto savedB = store_.saveRanking(rankingB);
    if (!savedB) {
        // Keep the pair consistent: neither side moves if one write fails.
        if (!store_.saveRanking(update.previousA)) {
            ARENA_LOG_ERROR(LogCategory::Rating,
                            "Failed to restore ranking after partial rating write");
        }
        return ArenaResult<RatingUpdate>::err(savedB.error());
    }

    if (commit) {
        auto committed = commit(update);
        if (!committed) {
            // Both rows are still locked, so no other match has built on them.
            restoreLocked(update);
            return ArenaResult<RatingUpdate>::err(committed.error());
        }
    }

    LogContext ctx;
    ctx.seasonId = seasonId;
    ctx.extra["player_a"] = std::to_string(playerA.value());
    ctx.extra["player_b"] = std::to_string(playerB.value());
    ctx.extra["delta_a"] = std::to_string(update.playerA.delta());
    ctx.extra["delta_b"] = std::to_string(update.playerB.delta());
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Rating, "Ratings updated", ctx);

    return ArenaResult<RatingUpdate>::ok(std::move(update));
}

void RankingService::restoreLocked(const RatingUpdate& update) {
    auto restoredA = store_.saveRanking(update.previousA);
    auto restoredB = store_.saveRanking(update.previousB);
    if (!restoredA || !restoredB) {
        LogContext ctx;
        ctx.seasonId = update.previousA.seasonId;
        ctx.extra["player_a"] = std::to_string(update.previousA.playerId.value());
        ctx.extra["player_b"] = std::to_string(update.previousB.playerId.value());
        ARENA_LOG_CTX(LogLevel::Error, LogCategory::Rating,
                      "Failed to restore rankings after rejected commit", ctx);
    }
}

void RankingService::recordResult(PlayerRanking& ranking, double actual, int32_t newRating) {
    ranking.rating = newRating;
    ranking.maxRating = std::max(ranking.maxRating, newRating);
    ++ranking.matchesPlayed;

    if (actual > 0.5) {
        ++ranking.matchesWon;
        ranking.currentStreak = std::max(ranking.currentStreak, 0) + 1;
        ranking.maxStreak = std::max(ranking.maxStreak, ranking.currentStreak);
    } else if (actual < 0.5) {
        ++ranking.matchesLost;
        ranking.currentStreak = std::min(ranking.currentStreak, 0) - 1;
    } else {
        ++ranking.matchesDrawn;
        ranking.currentStreak = 0;
    }
}

ArenaResult<uint32_t> RankingService::rankForRating(SeasonId seasonId, int32_t rating) const {
    auto above = store_.countRatingsAbove(seasonId, rating);
    if (!above) {
        return ArenaResult<uint32_t>::err(above.error());
    }
    return ArenaResult<uint32_t>::ok(static_cast<uint32_t>(above.value()) + 1);
}

ArenaResult<uint32_t> RankingService::rank(PlayerId playerId, SeasonId seasonId) const {
    auto info = rankingInfo(playerId, seasonId);
    if (!info) {
        return ArenaResult<uint32_t>::err(info.error());
    }
    return ArenaResult<uint32_t>::ok(info.value().rank);
}

ArenaResult<RankingInfo> RankingService::rankingInfo(PlayerId playerId, SeasonId seasonId) const {
    auto loaded = store_.loadRanking(playerId, seasonId);
    if (!loaded) {
        return ArenaResult<RankingInfo>::err(loaded.error());
    }
    if (!loaded.value().has_value()) {
        return ArenaResult<RankingInfo>::err(
            ArenaError(ErrorCode::RankingNotFound, "player has no ranking in this season"));
    }

    RankingInfo info;
    info.ranking = *loaded.value();
    info.winRate = winRate(info.ranking);

    auto ranked = rankForRating(seasonId, info.ranking.rating);
    if (!ranked) {
        return ArenaResult<RankingInfo>::err(ranked.error());
    }
    info.rank = ranked.value();
    return ArenaResult<RankingInfo>::ok(std::move(info));
}

ArenaResult<std::vector<RankingInfo>> RankingService::rankingList(
    SeasonId seasonId, std::size_t limit, std::size_t offset) const {
    auto page = store_.rankingsForSeason(seasonId, limit, offset);
    if (!page) {
        return ArenaResult<std::vector<RankingInfo>>::err(page.error());
    }

    std::vector<RankingInfo> list;
    list.reserve(page.value().size());
    for (std::size_t i = 0; i < page.value().size(); ++i) {
        RankingInfo info;
        info.ranking = page.value()[i];
        info.rank = static_cast<uint32_t>(offset + i + 1);
        info.winRate = winRate(info.ranking);
        list.push_back(std::move(info));
    }
    return ArenaResult<std::vector<RankingInfo>>::ok(std::move(list));
}

double RankingService::winRate(const PlayerRanking& ranking) {
    if (ranking.matchesPlayed == 0) {
        return 0.0;
    }
    double percent = static_cast<double>(ranking.matchesWon) * 100.0 /
                     static_cast<double>(ranking.matchesPlayed);
    return std::round(percent * 100.0) / 100.0;
}

} // namespace arena::service
