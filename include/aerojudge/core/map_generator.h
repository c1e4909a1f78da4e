#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "aerojudge/core/challenge.h"

namespace aerojudge {

// Generation ranges for one difficulty tier.
//
// Every range is monotone in tier: higher tiers get more obstacles, longer
// goal distances, more elevation variation, tighter capture zones, and permit
// motion laws the lower tiers do not.
struct TierProfile {
  int min_obstacles{6};
  int max_obstacles{12};

  // World box is [-half, half] x [-half, half] x [0, height].
  double world_half_extent_m{60.0};
  double world_height_m{40.0};

  // Horizontal start-to-goal distance range.
  double min_goal_distance_m{20.0};
  double max_goal_distance_m{50.0};

  double min_goal_elevation_m{2.0};
  double max_goal_elevation_m{6.0};

  double start_altitude_m{2.0};
  // Start is jittered within +/- this many metres of the origin.
  double start_jitter_m{5.0};

  double horizon_s{120.0};
  double capture_radius_m{2.0};
  double capture_hold_s{0.0};

  // Reachability cap: start-to-goal distance never exceeds
  // horizon_s * nominal_speed_m_s * reach_fraction.
  double nominal_speed_m_s{2.0};
  double reach_fraction{0.5};

  // Cruise speed of an ideal pilot; reference_time_s = distance / this.
  double reference_speed_m_s{6.0};

  double min_obstacle_size_m{0.5};
  double max_obstacle_size_m{2.5};

  bool goal_linear{false};
  bool goal_circular{false};
  // Goal may also stay static when any motion is permitted.
  bool goal_may_be_static{true};
  double max_goal_speed_m_s{0.0};

  bool obstacle_linear{false};
  bool obstacle_circular{false};
  double moving_obstacle_fraction{0.0};
  double max_obstacle_speed_m_s{0.0};

  int min_no_fly_zones{0};
  int max_no_fly_zones{0};

  double reach_cap_m() const { return horizon_s * nominal_speed_m_s * reach_fraction; }
};

// Built-in profile table.
const TierProfile& tier_profile(DifficultyTier tier);

// Thrown when the generator cannot produce a solvable layout within its
// attempt budget. This indicates a misconfigured profile, not bad luck.
class GenerationError : public std::runtime_error {
 public:
  explicit GenerationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Policy constants for resampling.
constexpr int kMaxLayoutAttempts = 64;
constexpr int kMaxObstaclePlacementAttempts = 32;

// Free space kept around the capture zone and the start position.
constexpr double kGoalClearanceM = 1.0;
constexpr double kStartClearanceM = 2.0;

// How many instants across the horizon moving bodies are checked at.
constexpr int kTrajectorySamples = 48;

struct GeneratorOptions {
  int max_layout_attempts{kMaxLayoutAttempts};
  int max_obstacle_placement_attempts{kMaxObstaclePlacementAttempts};
  std::array<TierProfile, kNumDifficultyTiers> profiles;

  GeneratorOptions();
};

// Deterministically derives challenges from (seed, tier).
//
// generate() is pure: no wall-clock, no global state, only the splitmix64
// stream seeded from its arguments.
class MapGenerator {
 public:
  MapGenerator() = default;
  explicit MapGenerator(GeneratorOptions options) : options_(std::move(options)) {}

  // Throws GenerationError if the attempt budget is exhausted.
  ChallengeSpec generate(std::uint64_t seed, DifficultyTier tier) const;

  const GeneratorOptions& options() const { return options_; }

 private:
  GeneratorOptions options_;
};

// Convenience wrapper using the built-in profiles.
ChallengeSpec generate_challenge(std::uint64_t seed, DifficultyTier tier);

// Checks the solvable-in-principle guarantees of a layout against a profile:
// goal trajectory inside the world, goal and start clear of obstacles and
// no-fly zones, goal not enclosed, start-to-goal distance within the cap.
// Empty => solvable.
std::vector<std::string> check_solvability(const ChallengeSpec& spec, const TierProfile& profile);

} // namespace aerojudge
