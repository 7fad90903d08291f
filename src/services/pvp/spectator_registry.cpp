/// @file spectator_registry.cpp
/// @brief SpectatorRegistry implementation.

#include "arena/service/spectator_registry.hpp"

#include "arena/foundation/arena_logger.hpp"
#include "arena/foundation/arena_metrics.hpp"

#include <optional>
#include <string>
#include <utility>

namespace arena::service {

using foundation::ArenaError;
using foundation::ArenaMetrics;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

SpectatorRegistry::SpectatorRegistry(IPvpStore& store, MatchLifecycle& matches,
                                     foundation::ClockFn clock)
    : store_(store), matches_(matches), clock_(std::move(clock)) {}

ArenaResult<JoinSpectateResult> SpectatorRegistry::joinSpectate(MatchId matchId,
                                                                PlayerId playerId) {
    std::optional<SpectatorRecord> existing;
    std::optional<SpectatorRecord> created;

    auto updated = matches_.modifyMatch(matchId, [&](Match& match) {
        if (!match.allowSpectate) {
            return ArenaResult<void>::err(
                ArenaError(ErrorCode::SpectateNotAllowed, "match does not allow spectators"));
        }
        if (match.status == MatchStatus::Finished) {
            return ArenaResult<void>::err(
                ArenaError(ErrorCode::InvalidStatus, "cannot spectate a finished match"));
        }

        auto found = store_.findActiveSpectator(matchId, playerId);
        if (!found) {
            return ArenaResult<void>::err(found.error());
        }
        if (found.value().has_value()) {
            existing = found.value();
            return ArenaResult<void>::ok();
        }

        SpectatorRecord record;
        record.spectatorId = SpectatorId(nextSpectatorId_.fetch_add(1));
        record.matchId = matchId;
        record.playerId = playerId;
        record.joinedAt = clock_();

        auto saved = store_.saveSpectatorRecord(record);
        if (!saved) {
            return ArenaResult<void>::err(saved.error());
        }
        created = record;
        ++match.spectatorCount;
        return ArenaResult<void>::ok();
    });

    LogContext ctx;
    ctx.matchId = matchId;
    ctx.playerId = playerId;

    if (!updated) {
        if (created.has_value()) {
            // Record was written but the count was not: close the record.
            created->leftAt = clock_();
            auto closed = store_.saveSpectatorRecord(*created);
            if (!closed) {
                ctx.extra["close_error"] = std::string(closed.error().message());
                ARENA_LOG_CTX(LogLevel::Error, LogCategory::Spectate,
                              "Failed to close orphaned spectator record", ctx);
            }
        }
        ctx.extra["reason"] = std::string(updated.error().message());
        ARENA_LOG_CTX(LogLevel::Warning, LogCategory::Spectate, "Spectate rejected", ctx);
        return ArenaResult<JoinSpectateResult>::err(updated.error());
    }

    JoinSpectateResult result;
    result.matchId = matchId;
    result.spectatorCount = updated.value().spectatorCount;

    if (existing.has_value()) {
        result.status = SpectateStatus::AlreadySpectating;
        result.spectatorId = existing->spectatorId;
        return ArenaResult<JoinSpectateResult>::ok(result);
    }

    result.status = SpectateStatus::Joined;
    result.spectatorId = created->spectatorId;

    active_.fetch_add(1, std::memory_order_relaxed);
    ArenaMetrics::instance().incrementGauge(foundation::metric::kActiveSpectators);

    ctx.extra["spectators"] = std::to_string(result.spectatorCount);
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Spectate, "Spectator joined", ctx);
    return ArenaResult<JoinSpectateResult>::ok(result);
}

ArenaResult<LeaveSpectateStatus> SpectatorRegistry::leaveSpectate(SpectatorId spectatorId) {
    auto loaded = store_.loadSpectator(spectatorId);
    if (!loaded) {
        return ArenaResult<LeaveSpectateStatus>::err(loaded.error());
    }
    if (!loaded.value().has_value() || !loaded.value()->isActive()) {
        return ArenaResult<LeaveSpectateStatus>::ok(LeaveSpectateStatus::NotSpectating);
    }

    const MatchId matchId = loaded.value()->matchId;
    bool left = false;

    auto updated = matches_.modifyMatch(matchId, [&](Match& match) {
        // Re-read under the match lock; a concurrent leave may have won.
        auto current = store_.loadSpectator(spectatorId);
        if (!current) {
            return ArenaResult<void>::err(current.error());
        }
        if (!current.value().has_value() || !current.value()->isActive()) {
            return ArenaResult<void>::ok();
        }

        SpectatorRecord record = *current.value();
        record.leftAt = clock_();
        auto saved = store_.saveSpectatorRecord(record);
        if (!saved) {
            return ArenaResult<void>::err(saved.error());
        }
        if (match.spectatorCount > 0) {
            --match.spectatorCount;
        }
        left = true;
        return ArenaResult<void>::ok();
    });

    if (!updated) {
        return ArenaResult<LeaveSpectateStatus>::err(updated.error());
    }
    if (!left) {
        return ArenaResult<LeaveSpectateStatus>::ok(LeaveSpectateStatus::NotSpectating);
    }

    active_.fetch_sub(1, std::memory_order_relaxed);
    ArenaMetrics::instance().decrementGauge(foundation::metric::kActiveSpectators);

    LogContext ctx;
    ctx.matchId = matchId;
    ctx.extra["spectator"] = std::to_string(spectatorId.value());
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Spectate, "Spectator left", ctx);
    return ArenaResult<LeaveSpectateStatus>::ok(LeaveSpectateStatus::Left);
}

ArenaResult<std::vector<SpectatorRecord>> SpectatorRegistry::listSpectators(
    MatchId matchId) const {
    return store_.activeSpectators(matchId);
}

ArenaResult<Match> SpectatorRegistry::setAllowSpectate(MatchId matchId, bool allow) {
    auto updated = matches_.modifyMatch(matchId, [allow](Match& match) {
        if (match.status == MatchStatus::Finished) {
            return ArenaResult<void>::err(
                ArenaError(ErrorCode::InvalidStatus, "finished matches are immutable"));
        }
        match.allowSpectate = allow;
        return ArenaResult<void>::ok();
    });

    if (updated) {
        LogContext ctx;
        ctx.matchId = matchId;
        ctx.extra["allow"] = allow ? "true" : "false";
        ARENA_LOG_CTX(LogLevel::Info, LogCategory::Spectate, "Spectating toggled", ctx);
    }
    return updated;
}

uint64_t SpectatorRegistry::activeCount() const noexcept {
    return active_.load(std::memory_order_relaxed);
}

} // namespace arena::service
