#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

#include "aerojudge/core/flight_plan.h"
#include "aerojudge/core/map_generator.h"

#define AJ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool mentions(const std::optional<std::string>& err, const std::string& needle) {
  return err && err->find(needle) != std::string::npos;
}

} // namespace

int test_flight_plan() {
  using namespace aerojudge;

  const CapabilityRegistry registry = CapabilityRegistry::defaults();
  const ChallengeSpec spec = generate_challenge(42, DifficultyTier::Novice);

  FlightPlan good;
  good.challenge_id = challenge_id(spec);
  good.declared_capability = *registry.find("quad-standard");
  good.control_sequence.push_back({0.0, {0.0, 0.0, 9.81}, 0.0});
  good.control_sequence.push_back({5.0, {1.0, 0.0, 9.81}, 0.1});
  AJ_ASSERT(!validate_flight_plan(spec, good, registry).has_value());

  // Registry basics.
  {
    AJ_ASSERT(!registry.empty());
    AJ_ASSERT(registry.models().size() == 3);
    AJ_ASSERT(registry.find("hex-heavy") != nullptr);
    AJ_ASSERT(registry.find("jet") == nullptr);

    DroneCapability tweaked = *registry.find("quad-racer");
    AJ_ASSERT(registry.allows(tweaked));
    tweaked.max_thrust_n *= 10.0;
    AJ_ASSERT(!registry.allows(tweaked));

    CapabilityRegistry custom;
    DroneCapability c;
    c.model = "quad-standard";
    c.mass_kg = 2.0;
    custom.add(c);
    custom.add(c);
    AJ_ASSERT(custom.models().size() == 1);
    AJ_ASSERT(custom.find("quad-standard")->mass_kg == 2.0);
  }

  // Wrong challenge.
  {
    FlightPlan p = good;
    p.challenge_id ^= 1u;
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "challenge_id"));
  }

  // Capability spoofing: a known model name with a fattened envelope.
  {
    FlightPlan p = good;
    p.declared_capability.battery_capacity_j = 1e9;
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "not an allow-listed"));

    p = good;
    p.declared_capability.model = "unknown-model";
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "unknown-model"));
  }

  // Empty and oversized sequences.
  {
    FlightPlan p = good;
    p.control_sequence.clear();
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "empty"));

    ReplayLimits limits;
    limits.max_samples = 1;
    AJ_ASSERT(mentions(validate_flight_plan(spec, good, registry, limits), "limit 1"));
  }

  // Non-finite numbers anywhere in a sample.
  {
    FlightPlan p = good;
    p.control_sequence[1].thrust_n.y = std::numeric_limits<double>::infinity();
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "non-finite"));

    p = good;
    p.control_sequence[0].yaw_torque_nm = std::nan("");
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "non-finite"));

    p = good;
    p.control_sequence[1].t_s = std::nan("");
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "non-finite"));
  }

  // Timestamps: negative, decreasing, past the horizon slack.
  {
    FlightPlan p = good;
    p.control_sequence[0].t_s = -0.5;
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "negative"));

    p = good;
    p.control_sequence[1].t_s = 0.0;
    p.control_sequence.push_back({-0.0, {}, 0.0});
    AJ_ASSERT(!validate_flight_plan(spec, p, registry).has_value());

    p = good;
    p.control_sequence.push_back({4.0, {}, 0.0});
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "back in time"));

    p = good;
    p.control_sequence.push_back({spec.horizon_s + 0.5, {}, 0.0});
    AJ_ASSERT(!validate_flight_plan(spec, p, registry).has_value());
    p.control_sequence.push_back({spec.horizon_s + 2.0, {}, 0.0});
    AJ_ASSERT(mentions(validate_flight_plan(spec, p, registry), "past the horizon"));
  }

  // Plan digests cover every sample.
  {
    FlightPlan p = good;
    AJ_ASSERT(flight_plan_digest64(p) == flight_plan_digest64(good));
    p.control_sequence[1].yaw_torque_nm = 0.2;
    AJ_ASSERT(flight_plan_digest64(p) != flight_plan_digest64(good));
  }

  return 0;
}
