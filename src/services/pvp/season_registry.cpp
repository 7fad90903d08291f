/// @file season_registry.cpp
/// @brief SeasonRegistry implementation.

#include "arena/service/season_registry.hpp"

#include "arena/foundation/arena_logger.hpp"

#include <algorithm>

namespace arena::service {

using foundation::ArenaError;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

SeasonRegistry::SeasonRegistry(foundation::ClockFn clock) : clock_(std::move(clock)) {}

ArenaResult<SeasonId> SeasonRegistry::activeSeason() const {
    std::lock_guard lock(mutex_);
    if (!active_.has_value()) {
        return ArenaResult<SeasonId>::err(
            ArenaError(ErrorCode::NoActiveSeason, "no rating season is active"));
    }
    return ArenaResult<SeasonId>::ok(*active_);
}

ArenaResult<Season> SeasonRegistry::createSeason(
    std::string name, uint32_t number, SeasonType type,
    Timestamp startTime, Timestamp endTime) {
    if (endTime <= startTime) {
        return ArenaResult<Season>::err(
            ArenaError(ErrorCode::InvalidSeason, "season must end after it starts"));
    }

    Season season;
    season.name = std::move(name);
    season.number = number;
    season.type = type;
    season.startTime = startTime;
    season.endTime = endTime;
    season.isActive = false;
    season.createdAt = clock_();

    {
        std::lock_guard lock(mutex_);
        season.seasonId = SeasonId(nextSeasonId_++);
        seasons_.emplace(season.seasonId, season);
    }

    LogContext ctx;
    ctx.seasonId = season.seasonId;
    ctx.extra["name"] = season.name;
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Season, "Season created", ctx);
    return ArenaResult<Season>::ok(std::move(season));
}

ArenaResult<Season> SeasonRegistry::activateSeason(SeasonId seasonId) {
    Season activated;
    {
        std::lock_guard lock(mutex_);
        auto it = seasons_.find(seasonId);
        if (it == seasons_.end()) {
            return ArenaResult<Season>::err(
                ArenaError(ErrorCode::SeasonNotFound, "season not found"));
        }

        for (auto& [id, season] : seasons_) {
            season.isActive = false;
        }
        it->second.isActive = true;
        active_ = seasonId;
        activated = it->second;
    }

    LogContext ctx;
    ctx.seasonId = seasonId;
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Season, "Season activated", ctx);
    return ArenaResult<Season>::ok(std::move(activated));
}

ArenaResult<Season> SeasonRegistry::endSeason(SeasonId seasonId) {
    Season ended;
    {
        std::lock_guard lock(mutex_);
        auto it = seasons_.find(seasonId);
        if (it == seasons_.end()) {
            return ArenaResult<Season>::err(
                ArenaError(ErrorCode::SeasonNotFound, "season not found"));
        }

        it->second.isActive = false;
        if (active_ == seasonId) {
            active_.reset();
        }
        ended = it->second;
    }

    LogContext ctx;
    ctx.seasonId = seasonId;
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Season, "Season ended", ctx);
    return ArenaResult<Season>::ok(std::move(ended));
}

std::optional<Season> SeasonRegistry::getSeason(SeasonId seasonId) const {
    std::lock_guard lock(mutex_);
    auto it = seasons_.find(seasonId);
    if (it == seasons_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Season> SeasonRegistry::listSeasons(std::size_t limit) const {
    std::vector<Season> all;
    {
        std::lock_guard lock(mutex_);
        all.reserve(seasons_.size());
        for (const auto& [id, season] : seasons_) {
            all.push_back(season);
        }
    }

    std::sort(all.begin(), all.end(), [](const Season& lhs, const Season& rhs) {
        if (lhs.number != rhs.number) {
            return lhs.number > rhs.number;
        }
        return lhs.seasonId > rhs.seasonId;
    });
    if (all.size() > limit) {
        all.resize(limit);
    }
    return all;
}

ArenaResult<SeasonState> SeasonRegistry::seasonStatus(SeasonId seasonId) const {
    auto season = getSeason(seasonId);
    if (!season.has_value()) {
        return ArenaResult<SeasonState>::err(
            ArenaError(ErrorCode::SeasonNotFound, "season not found"));
    }
    return ArenaResult<SeasonState>::ok(stateAt(*season, clock_()));
}

SeasonState SeasonRegistry::stateAt(const Season& season, Timestamp now) {
    if (now < season.startTime) {
        return SeasonState::Upcoming;
    }
    if (now > season.endTime) {
        return SeasonState::Ended;
    }
    return season.isActive ? SeasonState::Active : SeasonState::Inactive;
}

} // namespace arena::service
