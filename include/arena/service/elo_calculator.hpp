#pragma once

/// @file elo_calculator.hpp
/// @brief Elo rating calculations with tiered K-factors.
///
/// Expected score:  E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
/// Rating update:   R' = max(0, round(R + K * (S - E)))
///
/// K-factor tiers:
/// | Condition              | K  |
/// |------------------------|----|
/// | matchesPlayed < 30     | 40 |
/// | rating >= 2400         | 24 |
/// | otherwise              | 32 |

#include <cstdint>

#include "arena/service/pvp_types.hpp"

namespace arena::service {

/// Expected scores of both sides; a + b == 1.
struct ExpectedScores {
    double a = 0.5;
    double b = 0.5;
};

/// Actual scores of both sides (1.0 win, 0.5 draw, 0.0 loss).
struct ActualScores {
    double a = 0.5;
    double b = 0.5;
};

/// Static utility class for Elo rating calculations. Stateless.
class EloCalculator {
public:
    EloCalculator() = delete;

    static constexpr int32_t kBaseKFactor = 32;
    static constexpr int32_t kNewbieKFactor = 40;
    static constexpr int32_t kProKFactor = 24;

    /// Matches below which a player receives the newbie K-factor.
    static constexpr uint32_t kNewbieMatchThreshold = 30;

    /// Rating at or above which a player receives the pro K-factor.
    static constexpr int32_t kProRatingThreshold = 2400;

    /// Calculate both players' expected scores.
    [[nodiscard]] static ExpectedScores expectedScore(int32_t ratingA, int32_t ratingB);

    /// K-factor for a player with the given rating and experience.
    [[nodiscard]] static int32_t kFactor(int32_t rating, uint32_t matchesPlayed);

    /// Calculate the new rating after a game.
    ///
    /// @param rating         Rating before the game.
    /// @param expected       Expected score from expectedScore().
    /// @param actual         1.0 = win, 0.5 = draw, 0.0 = loss.
    /// @param matchesPlayed  Matches played before this one (selects K).
    /// @return Updated rating, never negative.
    [[nodiscard]] static int32_t newRating(
        int32_t rating, double expected, double actual, uint32_t matchesPlayed);

    /// Map a match outcome to each side's actual score.
    [[nodiscard]] static ActualScores actualScores(MatchOutcome outcome);

    /// Whether @p candidate lies within @p range of @p requester.
    [[nodiscard]] static bool isWithinRange(
        int32_t candidate, int32_t requester, int32_t range);
};

} // namespace arena::service
