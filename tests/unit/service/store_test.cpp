/// @file store_test.cpp
/// @brief Unit tests for InMemoryPvpStore.

#include <gtest/gtest.h>

#include <chrono>

#include "arena/service/pvp_store.hpp"

using namespace arena::service;
using namespace std::chrono_literals;

namespace {

PlayerRanking makeRanking(uint64_t player, uint64_t season, int32_t rating) {
    PlayerRanking ranking;
    ranking.playerId = PlayerId(player);
    ranking.seasonId = SeasonId(season);
    ranking.rating = rating;
    ranking.maxRating = rating;
    return ranking;
}

Match makeMatch(uint64_t id, uint64_t a, uint64_t b, MatchStatus status, Timestamp created) {
    Match match;
    match.matchId = MatchId(id);
    match.seasonId = SeasonId(1);
    match.playerAId = PlayerId(a);
    match.playerBId = PlayerId(b);
    match.status = status;
    match.createdAt = created;
    if (status == MatchStatus::Finished) {
        match.finishedAt = created + 60s;
    }
    return match;
}

} // namespace

class InMemoryPvpStoreTest : public ::testing::Test {
protected:
    InMemoryPvpStore store_;
    Timestamp t0_ = std::chrono::system_clock::now();
};

// -- Rankings -----------------------------------------------------------------

TEST_F(InMemoryPvpStoreTest, MissingRankingIsEmptyNotError) {
    auto loaded = store_.loadRanking(PlayerId(1), SeasonId(1));
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_FALSE(loaded.value().has_value());
}

TEST_F(InMemoryPvpStoreTest, SaveThenLoadRanking) {
    ASSERT_TRUE(store_.saveRanking(makeRanking(1, 1, 1234)).hasValue());
    auto loaded = store_.loadRanking(PlayerId(1), SeasonId(1));
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->rating, 1234);
    EXPECT_EQ(store_.rankingCount(), 1u);
}

TEST_F(InMemoryPvpStoreTest, RankingsAreScopedBySeason) {
    ASSERT_TRUE(store_.saveRanking(makeRanking(1, 1, 1100)).hasValue());
    ASSERT_TRUE(store_.saveRanking(makeRanking(1, 2, 900)).hasValue());

    EXPECT_EQ(store_.loadRanking(PlayerId(1), SeasonId(1)).value()->rating, 1100);
    EXPECT_EQ(store_.loadRanking(PlayerId(1), SeasonId(2)).value()->rating, 900);
}

TEST_F(InMemoryPvpStoreTest, RankingsForSeasonSortedWithTiesByPlayer) {
    ASSERT_TRUE(store_.saveRanking(makeRanking(3, 1, 1000)).hasValue());
    ASSERT_TRUE(store_.saveRanking(makeRanking(1, 1, 1200)).hasValue());
    ASSERT_TRUE(store_.saveRanking(makeRanking(2, 1, 1000)).hasValue());
    ASSERT_TRUE(store_.saveRanking(makeRanking(9, 2, 5000)).hasValue());

    auto page = store_.rankingsForSeason(SeasonId(1), 10, 0);
    ASSERT_TRUE(page.hasValue());
    ASSERT_EQ(page.value().size(), 3u);
    EXPECT_EQ(page.value()[0].playerId, PlayerId(1));
    EXPECT_EQ(page.value()[1].playerId, PlayerId(2));
    EXPECT_EQ(page.value()[2].playerId, PlayerId(3));
}

TEST_F(InMemoryPvpStoreTest, RankingsPagination) {
    for (uint64_t p = 1; p <= 5; ++p) {
        ASSERT_TRUE(store_.saveRanking(makeRanking(p, 1, 1000 + static_cast<int32_t>(p))).hasValue());
    }

    auto page = store_.rankingsForSeason(SeasonId(1), 2, 1);
    ASSERT_TRUE(page.hasValue());
    ASSERT_EQ(page.value().size(), 2u);
    EXPECT_EQ(page.value()[0].rating, 1004);
    EXPECT_EQ(page.value()[1].rating, 1003);

    auto beyond = store_.rankingsForSeason(SeasonId(1), 10, 10);
    ASSERT_TRUE(beyond.hasValue());
    EXPECT_TRUE(beyond.value().empty());
}

TEST_F(InMemoryPvpStoreTest, CountRatingsAboveIsStrict) {
    ASSERT_TRUE(store_.saveRanking(makeRanking(1, 1, 1200)).hasValue());
    ASSERT_TRUE(store_.saveRanking(makeRanking(2, 1, 1000)).hasValue());
    ASSERT_TRUE(store_.saveRanking(makeRanking(3, 1, 1000)).hasValue());

    EXPECT_EQ(store_.countRatingsAbove(SeasonId(1), 1000).value(), 1u);
    EXPECT_EQ(store_.countRatingsAbove(SeasonId(1), 999).value(), 3u);
    EXPECT_EQ(store_.countRatingsAbove(SeasonId(2), 0).value(), 0u);
}

// -- Matches ------------------------------------------------------------------

TEST_F(InMemoryPvpStoreTest, SaveThenLoadMatch) {
    ASSERT_TRUE(store_.saveMatch(makeMatch(1, 10, 20, MatchStatus::Waiting, t0_)).hasValue());
    auto loaded = store_.loadMatch(MatchId(1));
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->playerBId, PlayerId(20));

    EXPECT_FALSE(store_.loadMatch(MatchId(2)).value().has_value());
}

TEST_F(InMemoryPvpStoreTest, OpenMatchesNewestFirstAndLimited) {
    ASSERT_TRUE(store_.saveMatch(makeMatch(1, 1, 2, MatchStatus::Waiting, t0_)).hasValue());
    ASSERT_TRUE(store_.saveMatch(makeMatch(2, 3, 4, MatchStatus::Active, t0_ + 10s)).hasValue());
    ASSERT_TRUE(store_.saveMatch(makeMatch(3, 5, 6, MatchStatus::Finished, t0_ + 20s)).hasValue());
    ASSERT_TRUE(store_.saveMatch(makeMatch(4, 7, 8, MatchStatus::Waiting, t0_ + 30s)).hasValue());

    auto open = store_.openMatches(10);
    ASSERT_TRUE(open.hasValue());
    ASSERT_EQ(open.value().size(), 3u);
    EXPECT_EQ(open.value()[0].matchId, MatchId(4));
    EXPECT_EQ(open.value()[1].matchId, MatchId(2));
    EXPECT_EQ(open.value()[2].matchId, MatchId(1));

    EXPECT_EQ(store_.openMatches(1).value().size(), 1u);
}

TEST_F(InMemoryPvpStoreTest, FinishedMatchesForPlayer) {
    ASSERT_TRUE(store_.saveMatch(makeMatch(1, 1, 2, MatchStatus::Finished, t0_)).hasValue());
    ASSERT_TRUE(store_.saveMatch(makeMatch(2, 3, 1, MatchStatus::Finished, t0_ + 10s)).hasValue());
    ASSERT_TRUE(store_.saveMatch(makeMatch(3, 1, 4, MatchStatus::Active, t0_ + 20s)).hasValue());
    ASSERT_TRUE(store_.saveMatch(makeMatch(4, 5, 6, MatchStatus::Finished, t0_ + 30s)).hasValue());

    auto finished = store_.finishedMatchesFor(PlayerId(1), 10);
    ASSERT_TRUE(finished.hasValue());
    ASSERT_EQ(finished.value().size(), 2u);
    EXPECT_EQ(finished.value()[0].matchId, MatchId(2));
    EXPECT_EQ(finished.value()[1].matchId, MatchId(1));
}

// -- Spectators ---------------------------------------------------------------

TEST_F(InMemoryPvpStoreTest, ActiveSpectatorLookup) {
    SpectatorRecord watching{SpectatorId(1), MatchId(1), PlayerId(7), t0_, std::nullopt};
    SpectatorRecord left{SpectatorId(2), MatchId(1), PlayerId(8), t0_, t0_ + 5s};
    ASSERT_TRUE(store_.saveSpectatorRecord(watching).hasValue());
    ASSERT_TRUE(store_.saveSpectatorRecord(left).hasValue());

    auto found = store_.findActiveSpectator(MatchId(1), PlayerId(7));
    ASSERT_TRUE(found.hasValue());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->spectatorId, SpectatorId(1));

    EXPECT_FALSE(store_.findActiveSpectator(MatchId(1), PlayerId(8)).value().has_value());

    auto active = store_.activeSpectators(MatchId(1));
    ASSERT_TRUE(active.hasValue());
    ASSERT_EQ(active.value().size(), 1u);
    EXPECT_EQ(active.value()[0].playerId, PlayerId(7));
}
