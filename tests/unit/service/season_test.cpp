/// @file season_test.cpp
/// @brief Unit tests for SeasonRegistry.

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "arena/foundation/error_code.hpp"
#include "arena/service/season_registry.hpp"
#include "unit/service/pvp_test_support.hpp"

using namespace arena::service;
using namespace std::chrono_literals;
using arena::foundation::ErrorCode;
using arena::test::ManualClock;

class SeasonRegistryTest : public ::testing::Test {
protected:
    Season create(uint32_t number) {
        auto now = clock_.now();
        auto created = seasons_.createSeason("Season " + std::to_string(number), number,
                                             SeasonType::Regular, now - 24h, now + 24h * 30);
        EXPECT_TRUE(created.hasValue());
        return created.value();
    }

    ManualClock clock_;
    SeasonRegistry seasons_{clock_.fn()};
};

TEST_F(SeasonRegistryTest, NoActiveSeasonInitially) {
    auto active = seasons_.activeSeason();
    ASSERT_TRUE(active.hasError());
    EXPECT_EQ(active.error().code(), ErrorCode::NoActiveSeason);
}

TEST_F(SeasonRegistryTest, CreatedSeasonIsInactive) {
    auto season = create(1);
    EXPECT_TRUE(season.seasonId.isValid());
    EXPECT_FALSE(season.isActive);
    EXPECT_EQ(season.createdAt, clock_.now());
    EXPECT_TRUE(seasons_.activeSeason().hasError());
}

TEST_F(SeasonRegistryTest, CreateRejectsEmptyWindow) {
    auto now = clock_.now();
    auto same = seasons_.createSeason("bad", 1, SeasonType::Special, now, now);
    ASSERT_TRUE(same.hasError());
    EXPECT_EQ(same.error().code(), ErrorCode::InvalidSeason);

    auto reversed = seasons_.createSeason("bad", 1, SeasonType::Special, now, now - 1h);
    ASSERT_TRUE(reversed.hasError());
    EXPECT_EQ(reversed.error().code(), ErrorCode::InvalidSeason);
}

TEST_F(SeasonRegistryTest, ActivateMakesSeasonActive) {
    auto season = create(1);
    auto activated = seasons_.activateSeason(season.seasonId);
    ASSERT_TRUE(activated.hasValue());
    EXPECT_TRUE(activated.value().isActive);

    auto active = seasons_.activeSeason();
    ASSERT_TRUE(active.hasValue());
    EXPECT_EQ(active.value(), season.seasonId);
}

TEST_F(SeasonRegistryTest, ActivatingAnotherDeactivatesPrevious) {
    auto first = create(1);
    auto second = create(2);
    ASSERT_TRUE(seasons_.activateSeason(first.seasonId).hasValue());
    ASSERT_TRUE(seasons_.activateSeason(second.seasonId).hasValue());

    EXPECT_EQ(seasons_.activeSeason().value(), second.seasonId);
    EXPECT_FALSE(seasons_.getSeason(first.seasonId)->isActive);
    EXPECT_TRUE(seasons_.getSeason(second.seasonId)->isActive);
}

TEST_F(SeasonRegistryTest, ActivateUnknownSeason) {
    auto result = seasons_.activateSeason(SeasonId(42));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SeasonNotFound);
}

TEST_F(SeasonRegistryTest, EndSeasonClearsActive) {
    auto season = create(1);
    ASSERT_TRUE(seasons_.activateSeason(season.seasonId).hasValue());

    auto ended = seasons_.endSeason(season.seasonId);
    ASSERT_TRUE(ended.hasValue());
    EXPECT_FALSE(ended.value().isActive);
    EXPECT_TRUE(seasons_.activeSeason().hasError());
    EXPECT_TRUE(seasons_.getSeason(season.seasonId).has_value());
}

TEST_F(SeasonRegistryTest, EndingInactiveSeasonKeepsActiveOne) {
    auto first = create(1);
    auto second = create(2);
    ASSERT_TRUE(seasons_.activateSeason(second.seasonId).hasValue());
    ASSERT_TRUE(seasons_.endSeason(first.seasonId).hasValue());
    EXPECT_EQ(seasons_.activeSeason().value(), second.seasonId);
}

TEST_F(SeasonRegistryTest, ListSeasonsNewestNumberFirst) {
    create(2);
    create(5);
    create(1);

    auto all = seasons_.listSeasons();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].number, 5u);
    EXPECT_EQ(all[1].number, 2u);
    EXPECT_EQ(all[2].number, 1u);

    EXPECT_EQ(seasons_.listSeasons(2).size(), 2u);
}

TEST_F(SeasonRegistryTest, StatusFollowsWindowThenFlag) {
    auto now = clock_.now();
    auto upcoming = seasons_.createSeason("next", 3, SeasonType::Regular, now + 1h, now + 48h);
    auto current = create(2);
    ASSERT_TRUE(upcoming.hasValue());

    EXPECT_EQ(seasons_.seasonStatus(upcoming.value().seasonId).value(), SeasonState::Upcoming);
    EXPECT_EQ(seasons_.seasonStatus(current.seasonId).value(), SeasonState::Inactive);

    ASSERT_TRUE(seasons_.activateSeason(current.seasonId).hasValue());
    EXPECT_EQ(seasons_.seasonStatus(current.seasonId).value(), SeasonState::Active);

    // Past the end the window wins over the active flag.
    clock_.advance(24h * 31);
    EXPECT_EQ(seasons_.seasonStatus(current.seasonId).value(), SeasonState::Ended);
}

TEST_F(SeasonRegistryTest, StatusOfUnknownSeason) {
    auto status = seasons_.seasonStatus(SeasonId(9));
    ASSERT_TRUE(status.hasError());
    EXPECT_EQ(status.error().code(), ErrorCode::SeasonNotFound);
}
