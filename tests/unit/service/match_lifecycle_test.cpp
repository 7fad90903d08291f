/// @file match_lifecycle_test.cpp
/// @brief Unit tests for MatchLifecycle.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "arena/foundation/arena_metrics.hpp"
#include "arena/foundation/error_code.hpp"
#include "arena/service/match_lifecycle.hpp"
#include "arena/service/ranking_service.hpp"
#include "unit/service/pvp_test_support.hpp"

using namespace arena::service;
using namespace std::chrono_literals;
using arena::foundation::ArenaMetrics;
using arena::foundation::ErrorCode;
using arena::test::FaultyPvpStore;
using arena::test::ManualClock;

class MatchLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reset drops the histogram MatchLifecycle registered on construction.
        ArenaMetrics::instance().reset();
        ArenaMetrics::instance().registerHistogram(
            arena::foundation::metric::kMatchDuration,
            arena::foundation::HistogramBuckets::matchDuration());
    }

    Match create(uint64_t a = 1, uint64_t b = 2) {
        auto created = matches_->createMatch(PlayerId(a), PlayerId(b), 1000, 1000,
                                             MatchType::Arena, season_);
        EXPECT_TRUE(created.hasValue());
        return created.value();
    }

    Match createStarted(uint64_t a = 1, uint64_t b = 2) {
        auto match = create(a, b);
        EXPECT_TRUE(matches_->startMatch(match.matchId).hasValue());
        return match;
    }

    FaultyPvpStore store_;
    ManualClock clock_;
    RankingService rankings_{store_};
    std::unique_ptr<MatchLifecycle> matches_ =
        std::make_unique<MatchLifecycle>(store_, rankings_, clock_.fn());
    const SeasonId season_{1};
};

// -- Creation -----------------------------------------------------------------

TEST_F(MatchLifecycleTest, CreateMatchDefaults) {
    auto match = create(5, 9);
    EXPECT_TRUE(match.matchId.isValid());
    EXPECT_EQ(match.status, MatchStatus::Waiting);
    EXPECT_EQ(match.playerAId, PlayerId(5));
    EXPECT_EQ(match.playerBId, PlayerId(9));
    EXPECT_EQ(match.seasonId, season_);
    EXPECT_EQ(match.scoreA, 0);
    EXPECT_EQ(match.scoreB, 0);
    EXPECT_TRUE(match.allowSpectate);
    EXPECT_EQ(match.spectatorCount, 0u);
    EXPECT_EQ(match.createdAt, clock_.now());
    EXPECT_FALSE(match.winnerId.has_value());

    EXPECT_EQ(matches_->matchesCreated(), 1u);
    EXPECT_EQ(ArenaMetrics::instance().counterValue(arena::foundation::metric::kMatchesCreated), 1u);
}

TEST_F(MatchLifecycleTest, MatchIdsAreUnique) {
    auto first = create(1, 2);
    auto second = create(3, 4);
    EXPECT_NE(first.matchId, second.matchId);
}

TEST_F(MatchLifecycleTest, CreateRejectsSamePlayer) {
    auto created = matches_->createMatch(PlayerId(1), PlayerId(1), 1000, 1000,
                                         MatchType::Duel, season_);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(MatchLifecycleTest, CreatePropagatesStoreFailure) {
    store_.failMatchWrites = true;
    auto created = matches_->createMatch(PlayerId(1), PlayerId(2), 1000, 1000,
                                         MatchType::Arena, season_);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::StoreWriteFailed);
    EXPECT_EQ(matches_->matchesCreated(), 0u);
}

TEST_F(MatchLifecycleTest, GetUnknownMatch) {
    auto match = matches_->getMatch(MatchId(404));
    ASSERT_TRUE(match.hasError());
    EXPECT_EQ(match.error().code(), ErrorCode::MatchNotFound);
}

// -- Start --------------------------------------------------------------------

TEST_F(MatchLifecycleTest, StartFromWaiting) {
    auto match = create();
    clock_.advance(3s);

    auto started = matches_->startMatch(match.matchId);
    ASSERT_TRUE(started.hasValue());
    EXPECT_EQ(started.value().status, MatchStatus::Active);
    EXPECT_EQ(started.value().startedAt, clock_.now());

    auto stored = matches_->getMatch(match.matchId);
    EXPECT_EQ(stored.value().status, MatchStatus::Active);
}

TEST_F(MatchLifecycleTest, StartTwiceRejected) {
    auto match = createStarted();
    auto again = matches_->startMatch(match.matchId);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::InvalidStatus);
}

TEST_F(MatchLifecycleTest, StartUnknownMatch) {
    auto started = matches_->startMatch(MatchId(77));
    ASSERT_TRUE(started.hasError());
    EXPECT_EQ(started.error().code(), ErrorCode::MatchNotFound);
}

// -- Submit -------------------------------------------------------------------

TEST_F(MatchLifecycleTest, SubmitFinishesAndRates) {
    auto match = createStarted(1, 2);
    clock_.advance(95s);

    auto outcome = matches_->submitResult(match.matchId, PlayerId(1), 3, 1, 40, 38);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, MatchStatus::Finished);
    EXPECT_EQ(outcome.value().winnerId, PlayerId(1));
    EXPECT_EQ(outcome.value().scoreA, 3);
    EXPECT_EQ(outcome.value().scoreB, 1);
    EXPECT_EQ(outcome.value().durationSeconds, 95);
    EXPECT_EQ(outcome.value().playerA.playerId, PlayerId(1));
    EXPECT_EQ(outcome.value().playerA.newRating, 1020);
    EXPECT_EQ(outcome.value().playerB.newRating, 980);

    auto stored = matches_->getMatch(match.matchId).value();
    EXPECT_EQ(stored.status, MatchStatus::Finished);
    EXPECT_EQ(stored.movesA, 40);
    EXPECT_EQ(stored.movesB, 38);
    ASSERT_TRUE(stored.finishedAt.has_value());
    EXPECT_EQ(*stored.finishedAt, clock_.now());

    EXPECT_EQ(matches_->matchesFinished(), 1u);
    EXPECT_EQ(ArenaMetrics::instance().histogramCount(
                  arena::foundation::metric::kMatchDuration), 1u);
}

TEST_F(MatchLifecycleTest, SubmitWinnerAsPlayerB) {
    auto match = createStarted(1, 2);
    auto outcome = matches_->submitResult(match.matchId, PlayerId(2), 0, 2);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().playerA.delta(), -20);
    EXPECT_EQ(outcome.value().playerB.delta(), 20);
}

TEST_F(MatchLifecycleTest, SubmitDraw) {
    auto match = createStarted();
    auto outcome = matches_->submitResult(match.matchId, std::nullopt, 2, 2);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_FALSE(outcome.value().winnerId.has_value());
    EXPECT_EQ(outcome.value().playerA.delta(), 0);
    EXPECT_EQ(outcome.value().playerB.delta(), 0);
}

TEST_F(MatchLifecycleTest, SubmitOnWaitingRejected) {
    auto match = create();
    auto outcome = matches_->submitResult(match.matchId, PlayerId(1), 1, 0);
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::InvalidStatus);
    EXPECT_EQ(store_.rankingCount(), 0u);
}

TEST_F(MatchLifecycleTest, SubmitTwiceRejected) {
    auto match = createStarted();
    ASSERT_TRUE(matches_->submitResult(match.matchId, PlayerId(1), 1, 0).hasValue());

    auto again = matches_->submitResult(match.matchId, PlayerId(2), 0, 1);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::InvalidStatus);
    EXPECT_EQ(rankings_.currentRating(PlayerId(1), season_).value(), 1020);
}

TEST_F(MatchLifecycleTest, SubmitWithOutsiderWinnerRejected) {
    auto match = createStarted(1, 2);
    auto outcome = matches_->submitResult(match.matchId, PlayerId(3), 1, 0);
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::InvalidWinner);
    EXPECT_EQ(matches_->getMatch(match.matchId).value().status, MatchStatus::Active);
}

TEST_F(MatchLifecycleTest, SubmitUnknownMatch) {
    auto outcome = matches_->submitResult(MatchId(5), std::nullopt, 0, 0);
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::MatchNotFound);
}

TEST_F(MatchLifecycleTest, MatchWriteFailureRollsBackRatings) {
    auto match = createStarted(1, 2);
    store_.failMatchWrites = true;

    auto outcome = matches_->submitResult(match.matchId, PlayerId(1), 1, 0);
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::StoreWriteFailed);

    EXPECT_EQ(rankings_.currentRating(PlayerId(1), season_).value(), 1000);
    EXPECT_EQ(rankings_.currentRating(PlayerId(2), season_).value(), 1000);

    // The match is still Active, so a retry applies the result exactly once.
    store_.failMatchWrites = false;
    ASSERT_TRUE(matches_->submitResult(match.matchId, PlayerId(1), 1, 0).hasValue());
    EXPECT_EQ(rankings_.currentRating(PlayerId(1), season_).value(), 1020);
}

TEST_F(MatchLifecycleTest, ConcurrentSubmitAppliesOnce) {
    auto match = createStarted(1, 2);

    constexpr int kThreads = 8;
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            auto winner = (t % 2 == 0) ? PlayerId(1) : PlayerId(2);
            auto outcome = matches_->submitResult(match.matchId, winner, 1, 0);
            if (outcome.hasValue()) {
                ++succeeded;
            } else if (outcome.error().code() == ErrorCode::InvalidStatus) {
                ++rejected;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);

    auto a = store_.loadRanking(PlayerId(1), season_).value();
    auto b = store_.loadRanking(PlayerId(2), season_).value();
    EXPECT_EQ(a->matchesPlayed, 1u);
    EXPECT_EQ(b->matchesPlayed, 1u);
    EXPECT_EQ(a->rating + b->rating, 2000);
}

TEST_F(MatchLifecycleTest, FailedWriteKeepsOverlappingMatchRatings) {
    auto first = createStarted(1, 2);
    auto second = createStarted(1, 3);

    // While the first match's Finished write is in flight, a second match
    // sharing player 1 finishes; then the first write fails.
    std::atomic<bool> secondOk{false};
    std::thread other;
    store_.beforeMatchWrite = [&](const Match& m) {
        if (m.matchId != first.matchId || m.status != MatchStatus::Finished) {
            return false;
        }
        other = std::thread([&]() {
            secondOk = matches_->submitResult(second.matchId, PlayerId(1), 1, 0).hasValue();
        });
        std::this_thread::sleep_for(50ms);
        return true;
    };

    auto outcome = matches_->submitResult(first.matchId, PlayerId(1), 1, 0);
    ASSERT_TRUE(other.joinable());
    other.join();
    store_.beforeMatchWrite = nullptr;

    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::StoreWriteFailed);
    EXPECT_TRUE(secondOk.load());

    auto p1 = store_.loadRanking(PlayerId(1), season_).value();
    auto p2 = store_.loadRanking(PlayerId(2), season_).value();
    auto p3 = store_.loadRanking(PlayerId(3), season_).value();
    ASSERT_TRUE(p1.has_value());
    ASSERT_TRUE(p2.has_value());
    ASSERT_TRUE(p3.has_value());
    EXPECT_EQ(p1->matchesPlayed, 1u);
    EXPECT_EQ(p1->rating, 1020);
    EXPECT_EQ(p2->matchesPlayed, 0u);
    EXPECT_EQ(p2->rating, 1000);
    EXPECT_EQ(p3->rating, 980);

    EXPECT_EQ(matches_->getMatch(first.matchId).value().status, MatchStatus::Active);
    EXPECT_EQ(matches_->getMatch(second.matchId).value().status, MatchStatus::Finished);
}

// -- Modify / queries ---------------------------------------------------------

TEST_F(MatchLifecycleTest, ModifyMatchAbortsOnMutatorError) {
    auto match = create();
    auto result = matches_->modifyMatch(match.matchId, [](Match& m) {
        m.allowSpectate = false;
        return arena::foundation::ArenaResult<void>::err(
            arena::foundation::ArenaError(ErrorCode::InvalidArgument, "nope"));
    });
    ASSERT_TRUE(result.hasError());
    EXPECT_TRUE(matches_->getMatch(match.matchId).value().allowSpectate);
}

TEST_F(MatchLifecycleTest, OpenMatchesExcludeFinished) {
    auto waiting = create(1, 2);
    clock_.advance(1s);
    auto finished = createStarted(3, 4);
    ASSERT_TRUE(matches_->submitResult(finished.matchId, PlayerId(3), 1, 0).hasValue());
    clock_.advance(1s);
    auto active = createStarted(5, 6);

    auto open = matches_->openMatches(10);
    ASSERT_TRUE(open.hasValue());
    ASSERT_EQ(open.value().size(), 2u);
    EXPECT_EQ(open.value()[0].matchId, active.matchId);
    EXPECT_EQ(open.value()[1].matchId, waiting.matchId);
}

TEST_F(MatchLifecycleTest, PlayerHistoryFromPlayersSide) {
    auto first = createStarted(1, 2);
    ASSERT_TRUE(matches_->submitResult(first.matchId, PlayerId(1), 5, 2).hasValue());
    clock_.advance(10s);
    auto second = createStarted(3, 1);
    ASSERT_TRUE(matches_->submitResult(second.matchId, std::nullopt, 1, 1).hasValue());

    auto history = matches_->playerHistory(PlayerId(1), 20);
    ASSERT_TRUE(history.hasValue());
    ASSERT_EQ(history.value().size(), 2u);

    const auto& latest = history.value()[0];
    EXPECT_EQ(latest.matchId, second.matchId);
    EXPECT_EQ(latest.opponentId, PlayerId(3));
    EXPECT_TRUE(latest.isDraw);
    EXPECT_FALSE(latest.isWinner);

    const auto& earlier = history.value()[1];
    EXPECT_EQ(earlier.opponentId, PlayerId(2));
    EXPECT_EQ(earlier.playerScore, 5);
    EXPECT_EQ(earlier.opponentScore, 2);
    EXPECT_TRUE(earlier.isWinner);
    EXPECT_FALSE(earlier.isDraw);

    auto loser = matches_->playerHistory(PlayerId(2), 20);
    ASSERT_EQ(loser.value().size(), 1u);
    EXPECT_EQ(loser.value()[0].playerScore, 2);
    EXPECT_FALSE(loser.value()[0].isWinner);
}
