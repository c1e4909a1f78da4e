#pragma once

#include "aerojudge/core/replay_result.h"

namespace aerojudge {

// Bounded participant score in [kMinScore, kMaxScore].
using ParticipantScore = double;

// Reward policy constants.
//
// Ordering guarantees:
//   - collided / invalid input => kMinScore, below every other outcome
//   - any goal-reaching result >= kGoalBase > kSurvivalScore, so reaching the
//     goal (however slowly or expensively) beats every non-reaching result
//   - speed outweighs efficiency, and compare_scores() breaks exact ties on
//     speed first
struct RewardPolicy {
  static constexpr double kMinScore = 0.0;
  static constexpr double kMaxScore = 1.0;

  static constexpr double kGoalBase = 0.55;
  static constexpr double kSpeedWeight = 0.30;
  static constexpr double kEfficiencyWeight = 0.15;

  // Flown the whole way without crashing, but never captured the goal.
  static constexpr double kSurvivalScore = 0.05;
};

static_assert(RewardPolicy::kGoalBase > RewardPolicy::kSurvivalScore, "goal must outscore survival");
static_assert(RewardPolicy::kSpeedWeight > RewardPolicy::kEfficiencyWeight, "speed must dominate efficiency");

struct ScoreBreakdown {
  // Both sub-terms are in [0, 1] and zero unless the goal was reached.
  double speed{0.0};
  double efficiency{0.0};
  double total{RewardPolicy::kMinScore};
};

// Pure and total: any result (including NaN-laden ones) maps into the range.
ScoreBreakdown score_breakdown(const ReplayResult& result);
ParticipantScore score(const ReplayResult& result);

// 1 at or below reference time, 0 at or beyond the horizon, linear between.
double speed_term(double time_to_goal_s, double reference_time_s, double horizon_s);

// 1 - clamp(energy / capacity, 0, 1).
double efficiency_term(double energy_used_j, double battery_capacity_j);

// Negative if a ranks below b, 0 if tied, positive if above. Lexicographic
// on total, then speed, then efficiency.
int compare_scores(const ScoreBreakdown& a, const ScoreBreakdown& b);

} // namespace aerojudge
