/// @file pvp_store.cpp
/// @brief InMemoryPvpStore implementation.

#include "arena/service/pvp_store.hpp"

#include <algorithm>

namespace arena::service {

// -- Rankings -----------------------------------------------------------------

ArenaResult<std::optional<PlayerRanking>> InMemoryPvpStore::loadRanking(
    PlayerId playerId, SeasonId seasonId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rankings_.find({seasonId.value(), playerId.value()});
    if (it == rankings_.end()) {
        return ArenaResult<std::optional<PlayerRanking>>::ok(std::nullopt);
    }
    return ArenaResult<std::optional<PlayerRanking>>::ok(it->second);
}

ArenaResult<void> InMemoryPvpStore::saveRanking(const PlayerRanking& ranking) {
    std::lock_guard<std::mutex> lock(mutex_);
    rankings_[{ranking.seasonId.value(), ranking.playerId.value()}] = ranking;
    return ArenaResult<void>::ok();
}

ArenaResult<std::vector<PlayerRanking>> InMemoryPvpStore::rankingsForSeason(
    SeasonId seasonId, std::size_t limit, std::size_t offset) const {
    std::vector<PlayerRanking> season;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto first = rankings_.lower_bound({seasonId.value(), 0});
        for (auto it = first; it != rankings_.end() && it->first.first == seasonId.value(); ++it) {
            season.push_back(it->second);
        }
    }

    std::stable_sort(season.begin(), season.end(),
                     [](const PlayerRanking& lhs, const PlayerRanking& rhs) {
                         return lhs.rating > rhs.rating;
                     });

    std::vector<PlayerRanking> page;
    if (offset >= season.size()) {
        return ArenaResult<std::vector<PlayerRanking>>::ok(std::move(page));
    }
    auto end = std::min(season.size(), offset + limit);
    page.assign(season.begin() + static_cast<std::ptrdiff_t>(offset),
                season.begin() + static_cast<std::ptrdiff_t>(end));
    return ArenaResult<std::vector<PlayerRanking>>::ok(std::move(page));
}

ArenaResult<std::size_t> InMemoryPvpStore::countRatingsAbove(
    SeasonId seasonId, int32_t rating) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    auto first = rankings_.lower_bound({seasonId.value(), 0});
    for (auto it = first; it != rankings_.end() && it->first.first == seasonId.value(); ++it) {
        if (it->second.rating > rating) {
            ++count;
        }
    }
    return ArenaResult<std::size_t>::ok(count);
}

// -- Matches ------------------------------------------------------------------

ArenaResult<std::optional<Match>> InMemoryPvpStore::loadMatch(MatchId matchId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(matchId);
    if (it == matches_.end()) {
        return ArenaResult<std::optional<Match>>::ok(std::nullopt);
    }
    return ArenaResult<std::optional<Match>>::ok(it->second);
}

ArenaResult<void> InMemoryPvpStore::saveMatch(const Match& match) {
    std::lock_guard<std::mutex> lock(mutex_);
    matches_[match.matchId] = match;
    return ArenaResult<void>::ok();
}

ArenaResult<std::vector<Match>> InMemoryPvpStore::openMatches(std::size_t limit) const {
    std::vector<Match> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, match] : matches_) {
            if (match.status != MatchStatus::Finished) {
                open.push_back(match);
            }
        }
    }

    std::sort(open.begin(), open.end(), [](const Match& lhs, const Match& rhs) {
        if (lhs.createdAt != rhs.createdAt) {
            return lhs.createdAt > rhs.createdAt;
        }
        return lhs.matchId > rhs.matchId;
    });
    if (open.size() > limit) {
        open.resize(limit);
    }
    return ArenaResult<std::vector<Match>>::ok(std::move(open));
}

ArenaResult<std::vector<Match>> InMemoryPvpStore::finishedMatchesFor(
    PlayerId playerId, std::size_t limit) const {
    std::vector<Match> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, match] : matches_) {
            if (match.status == MatchStatus::Finished && match.hasPlayer(playerId)) {
                finished.push_back(match);
            }
        }
    }

    std::sort(finished.begin(), finished.end(), [](const Match& lhs, const Match& rhs) {
        if (lhs.finishedAt != rhs.finishedAt) {
            return lhs.finishedAt > rhs.finishedAt;
        }
        return lhs.matchId > rhs.matchId;
    });
    if (finished.size() > limit) {
        finished.resize(limit);
    }
    return ArenaResult<std::vector<Match>>::ok(std::move(finished));
}

// -- Spectators ---------------------------------------------------------------

ArenaResult<std::optional<SpectatorRecord>> InMemoryPvpStore::loadSpectator(
    SpectatorId spectatorId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spectators_.find(spectatorId);
    if (it == spectators_.end()) {
        return ArenaResult<std::optional<SpectatorRecord>>::ok(std::nullopt);
    }
    return ArenaResult<std::optional<SpectatorRecord>>::ok(it->second);
}

ArenaResult<void> InMemoryPvpStore::saveSpectatorRecord(const SpectatorRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    spectators_[record.spectatorId] = record;
    return ArenaResult<void>::ok();
}

ArenaResult<std::optional<SpectatorRecord>> InMemoryPvpStore::findActiveSpectator(
    MatchId matchId, PlayerId playerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : spectators_) {
        if (record.matchId == matchId && record.playerId == playerId && record.isActive()) {
            return ArenaResult<std::optional<SpectatorRecord>>::ok(record);
        }
    }
    return ArenaResult<std::optional<SpectatorRecord>>::ok(std::nullopt);
}

ArenaResult<std::vector<SpectatorRecord>> InMemoryPvpStore::activeSpectators(
    MatchId matchId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SpectatorRecord> active;
    for (const auto& [id, record] : spectators_) {
        if (record.matchId == matchId && record.isActive()) {
            active.push_back(record);
        }
    }
    return ArenaResult<std::vector<SpectatorRecord>>::ok(std::move(active));
}

std::size_t InMemoryPvpStore::rankingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rankings_.size();
}

std::size_t InMemoryPvpStore::matchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return matches_.size();
}

} // namespace arena::service
