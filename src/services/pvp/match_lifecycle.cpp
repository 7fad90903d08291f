/// @file match_lifecycle.cpp
/// @brief MatchLifecycle implementation.

#include "arena/service/match_lifecycle.hpp"

#include "arena/foundation/arena_logger.hpp"
#include "arena/foundation/arena_metrics.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace arena::service {

using foundation::ArenaError;
using foundation::ArenaMetrics;
using foundation::ErrorCode;
using foundation::HistogramBuckets;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

ArenaError matchNotFound(MatchId matchId) {
    return ArenaError(ErrorCode::MatchNotFound,
                      "match not found: " + std::to_string(matchId.value()));
}

ArenaError invalidStatus(const Match& match, std::string_view action) {
    return ArenaError(ErrorCode::InvalidStatus,
                      std::string("cannot ") + std::string(action) + " a match that is " +
                          std::string(matchStatusName(match.status)));
}

MatchOutcome outcomeFor(const Match& match, const std::optional<PlayerId>& winnerId) {
    if (!winnerId.has_value()) {
        return MatchOutcome::Draw;
    }
    return *winnerId == match.playerAId ? MatchOutcome::PlayerAWins : MatchOutcome::PlayerBWins;
}

} // namespace

MatchLifecycle::MatchLifecycle(IPvpStore& store, RankingService& rankings,
                               foundation::ClockFn clock)
    : store_(store), rankings_(rankings), clock_(std::move(clock)) {
    ArenaMetrics::instance().registerHistogram(
        foundation::metric::kMatchDuration, HistogramBuckets::matchDuration());
}

// -- Creation -----------------------------------------------------------------

ArenaResult<Match> MatchLifecycle::createMatch(
    PlayerId playerA, PlayerId playerB,
    int32_t ratingA, int32_t ratingB,
    MatchType matchType, SeasonId seasonId) {
    if (playerA == playerB) {
        return ArenaResult<Match>::err(
            ArenaError(ErrorCode::InvalidArgument, "a match needs two distinct players"));
    }

    Match match;
    match.matchId = nextMatchId();
    match.seasonId = seasonId;
    match.matchType = matchType;
    match.playerAId = playerA;
    match.playerBId = playerB;
    match.status = MatchStatus::Waiting;
    match.allowSpectate = true;
    match.spectatorCount = 0;
    match.createdAt = clock_();

    auto saved = store_.saveMatch(match);
    if (!saved) {
        return ArenaResult<Match>::err(saved.error());
    }

    matchesCreated_.fetch_add(1, std::memory_order_relaxed);
    ArenaMetrics::instance().incrementCounter(foundation::metric::kMatchesCreated);

    LogContext ctx;
    ctx.matchId = match.matchId;
    ctx.seasonId = seasonId;
    ctx.extra["type"] = std::string(matchTypeName(matchType));
    ctx.extra["player_a"] = std::to_string(playerA.value()) + "@" + std::to_string(ratingA);
    ctx.extra["player_b"] = std::to_string(playerB.value()) + "@" + std::to_string(ratingB);
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Match, "Match created", ctx);

    return ArenaResult<Match>::ok(std::move(match));
}

ArenaResult<Match> MatchLifecycle::getMatch(MatchId matchId) const {
    auto loaded = store_.loadMatch(matchId);
    if (!loaded) {
        return ArenaResult<Match>::err(loaded.error());
    }
    if (!loaded.value().has_value()) {
        return ArenaResult<Match>::err(matchNotFound(matchId));
    }
    return ArenaResult<Match>::ok(*loaded.value());
}

ArenaResult<Match> MatchLifecycle::modifyMatch(MatchId matchId, const MatchMutator& mutator) {
    auto handle = locks_.get(matchId);
    std::lock_guard lock(*handle);

    auto loaded = getMatch(matchId);
    if (!loaded) {
        return loaded;
    }

    Match match = std::move(loaded).value();
    auto edited = mutator(match);
    if (!edited) {
        return ArenaResult<Match>::err(edited.error());
    }

    auto saved = store_.saveMatch(match);
    if (!saved) {
        return ArenaResult<Match>::err(saved.error());
    }
    return ArenaResult<Match>::ok(std::move(match));
}

// -- Transitions --------------------------------------------------------------

ArenaResult<StartMatchResult> MatchLifecycle::startMatch(MatchId matchId) {
    auto started = modifyMatch(matchId, [this](Match& match) {
        switch (match.status) {
            case MatchStatus::Waiting:
                match.status = MatchStatus::Active;
                match.startedAt = clock_();
                return ArenaResult<void>::ok();
            case MatchStatus::Active:
            case MatchStatus::Finished:
                return ArenaResult<void>::err(invalidStatus(match, "start"));
        }
        return ArenaResult<void>::err(invalidStatus(match, "start"));
    });

    LogContext ctx;
    ctx.matchId = matchId;
    if (!started) {
        ctx.extra["reason"] = std::string(started.error().message());
        ARENA_LOG_CTX(LogLevel::Warning, LogCategory::Match, "Match start rejected", ctx);
        return ArenaResult<StartMatchResult>::err(started.error());
    }
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Match, "Match started", ctx);

    const auto& match = started.value();
    return ArenaResult<StartMatchResult>::ok(
        StartMatchResult{match.matchId, match.status, *match.startedAt});
}

ArenaResult<SubmitResultOutcome> MatchLifecycle::submitResult(
    MatchId matchId, std::optional<PlayerId> winnerId,
    int32_t scoreA, int32_t scoreB,
    int32_t movesA, int32_t movesB) {
    LogContext ctx;
    ctx.matchId = matchId;

    auto reject = [&ctx](ArenaError error) {
        ctx.extra["reason"] = std::string(error.message());
        ARENA_LOG_CTX(LogLevel::Warning, LogCategory::Match, "Match result rejected", ctx);
        return ArenaResult<SubmitResultOutcome>::err(std::move(error));
    };

    // Held across validation, rating application and the final write, so a
    // concurrent submission observes either Active (and waits) or Finished.
    auto handle = locks_.get(matchId);
    std::lock_guard lock(*handle);

    auto loaded = getMatch(matchId);
    if (!loaded) {
        return reject(loaded.error());
    }
    Match match = std::move(loaded).value();

    if (match.status != MatchStatus::Active) {
        return reject(invalidStatus(match, "submit a result for"));
    }
    if (winnerId.has_value() && !match.hasPlayer(*winnerId)) {
        return reject(ArenaError(ErrorCode::InvalidWinner,
                                 "winner " + std::to_string(winnerId->value()) +
                                     " is not a participant of this match"));
    }

    auto now = clock_();
    match.scoreA = scoreA;
    match.scoreB = scoreB;
    match.movesA = movesA;
    match.movesB = movesB;
    match.winnerId = winnerId;
    match.status = MatchStatus::Finished;
    match.finishedAt = now;
    if (match.startedAt.has_value()) {
        match.durationSeconds =
            std::chrono::duration_cast<std::chrono::seconds>(now - *match.startedAt).count();
    }

    // The Finished write runs under both ranking locks; if it fails the
    // ratings are restored there and the match stays Active for a retry.
    auto update = rankings_.applyResult(
        match.seasonId, match.playerAId, match.playerBId, outcomeFor(match, winnerId),
        [this, &match](const RatingUpdate&) { return store_.saveMatch(match); });
    if (!update) {
        return reject(update.error());
    }

    matchesFinished_.fetch_add(1, std::memory_order_relaxed);
    auto& metrics = ArenaMetrics::instance();
    metrics.incrementCounter(foundation::metric::kMatchesFinished);
    metrics.recordHistogram(foundation::metric::kMatchDuration,
                            static_cast<double>(match.durationSeconds));

    SubmitResultOutcome outcome;
    outcome.matchId = match.matchId;
    outcome.status = match.status;
    outcome.winnerId = match.winnerId;
    outcome.scoreA = match.scoreA;
    outcome.scoreB = match.scoreB;
    outcome.durationSeconds = match.durationSeconds;
    outcome.playerA = update.value().playerA;
    outcome.playerB = update.value().playerB;

    ctx.seasonId = match.seasonId;
    ctx.extra["score"] = std::to_string(match.scoreA) + ":" + std::to_string(match.scoreB);
    ctx.extra["winner"] = match.winnerId ? std::to_string(match.winnerId->value()) : "draw";
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Match, "Match finished", ctx);

    return ArenaResult<SubmitResultOutcome>::ok(std::move(outcome));
}

// -- Queries ------------------------------------------------------------------

ArenaResult<std::vector<Match>> MatchLifecycle::openMatches(std::size_t limit) const {
    return store_.openMatches(limit);
}

ArenaResult<std::vector<MatchHistoryEntry>> MatchLifecycle::playerHistory(
    PlayerId playerId, std::size_t limit) const {
    auto matches = store_.finishedMatchesFor(playerId, limit);
    if (!matches) {
        return ArenaResult<std::vector<MatchHistoryEntry>>::err(matches.error());
    }

    std::vector<MatchHistoryEntry> history;
    history.reserve(matches.value().size());
    for (const auto& match : matches.value()) {
        bool isA = match.playerAId == playerId;

        MatchHistoryEntry entry;
        entry.matchId = match.matchId;
        entry.matchType = match.matchType;
        entry.opponentId = isA ? match.playerBId : match.playerAId;
        entry.playerScore = isA ? match.scoreA : match.scoreB;
        entry.opponentScore = isA ? match.scoreB : match.scoreA;
        entry.isWinner = match.winnerId == playerId;
        entry.isDraw = !match.winnerId.has_value();
        entry.finishedAt = match.finishedAt;
        history.push_back(entry);
    }
    return ArenaResult<std::vector<MatchHistoryEntry>>::ok(std::move(history));
}

uint64_t MatchLifecycle::matchesCreated() const noexcept {
    return matchesCreated_.load(std::memory_order_relaxed);
}

uint64_t MatchLifecycle::matchesFinished() const noexcept {
    return matchesFinished_.load(std::memory_order_relaxed);
}

MatchId MatchLifecycle::nextMatchId() {
    return MatchId(nextMatchId_.fetch_add(1));
}

} // namespace arena::service
