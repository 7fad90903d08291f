/// @file elo_calculator.cpp
/// @brief EloCalculator implementation.

#include "arena/service/elo_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace arena::service {

ExpectedScores EloCalculator::expectedScore(int32_t ratingA, int32_t ratingB) {
    double exponent = static_cast<double>(ratingB - ratingA) / 400.0;
    double a = 1.0 / (1.0 + std::pow(10.0, exponent));
    return ExpectedScores{a, 1.0 - a};
}

int32_t EloCalculator::kFactor(int32_t rating, uint32_t matchesPlayed) {
    if (matchesPlayed < kNewbieMatchThreshold) {
        return kNewbieKFactor;
    }
    if (rating >= kProRatingThreshold) {
        return kProKFactor;
    }
    return kBaseKFactor;
}

int32_t EloCalculator::newRating(
    int32_t rating, double expected, double actual, uint32_t matchesPlayed) {
    double k = static_cast<double>(kFactor(rating, matchesPlayed));
    double updated = static_cast<double>(rating) + k * (actual - expected);
    return std::max<int32_t>(0, static_cast<int32_t>(std::lround(updated)));
}

ActualScores EloCalculator::actualScores(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::PlayerAWins: return ActualScores{1.0, 0.0};
        case MatchOutcome::PlayerBWins: return ActualScores{0.0, 1.0};
        case MatchOutcome::Draw:        return ActualScores{0.5, 0.5};
    }
    return ActualScores{0.5, 0.5};
}

bool EloCalculator::isWithinRange(
    int32_t candidate, int32_t requester, int32_t range) {
    return std::abs(candidate - requester) <= range;
}

} // namespace arena::service
