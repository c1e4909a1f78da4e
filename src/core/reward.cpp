#include "aerojudge/core/reward.h"

#include <algorithm>
#include <cmath>

namespace aerojudge {
namespace {

double clamp01(double v) {
  if (!std::isfinite(v)) return 0.0;
  return std::clamp(v, 0.0, 1.0);
}

int cmp(double a, double b) {
  if (a < b) return -1;
  if (a > b) return 1;
  return 0;
}

} // namespace

double speed_term(double time_to_goal_s, double reference_time_s, double horizon_s) {
  if (!std::isfinite(time_to_goal_s) || !std::isfinite(horizon_s)) return 0.0;
  if (time_to_goal_s >= horizon_s) return 0.0;
  if (!std::isfinite(reference_time_s) || time_to_goal_s <= reference_time_s) return 1.0;
  const double span = horizon_s - reference_time_s;
  if (span <= 0.0) return 0.0;
  return clamp01((horizon_s - time_to_goal_s) / span);
}

double efficiency_term(double energy_used_j, double battery_capacity_j) {
  if (!std::isfinite(battery_capacity_j) || battery_capacity_j <= 0.0) return 0.0;
  if (!std::isfinite(energy_used_j)) return 0.0;
  return 1.0 - clamp01(energy_used_j / battery_capacity_j);
}

ScoreBreakdown score_breakdown(const ReplayResult& result) {
  ScoreBreakdown b;
  if (result.collided || result.termination_reason == TerminationReason::InvalidInput ||
      result.termination_reason == TerminationReason::Collision) {
    return b;
  }
  if (!result.goal_reached) {
    b.total = RewardPolicy::kSurvivalScore;
    return b;
  }

  // A goal without a time is treated as arriving at the horizon.
  const double t = result.time_to_goal_s.value_or(result.horizon_s);
  b.speed = speed_term(t, result.reference_time_s, result.horizon_s);
  b.efficiency = efficiency_term(result.energy_used_j, result.battery_capacity_j);
  b.total = RewardPolicy::kGoalBase + RewardPolicy::kSpeedWeight * b.speed +
            RewardPolicy::kEfficiencyWeight * b.efficiency;
  b.total = std::clamp(b.total, RewardPolicy::kMinScore, RewardPolicy::kMaxScore);
  return b;
}

ParticipantScore score(const ReplayResult& result) { return score_breakdown(result).total; }

int compare_scores(const ScoreBreakdown& a, const ScoreBreakdown& b) {
  if (const int c = cmp(a.total, b.total)) return c;
  if (const int c = cmp(a.speed, b.speed)) return c;
  return cmp(a.efficiency, b.efficiency);
}

} // namespace aerojudge
