#pragma once

#include <map>
#include <string>
#include <vector>

#include "aerojudge/core/trust.h"

namespace aerojudge {

// How a trust snapshot is turned into the weight vector handed to the ledger.
//
// Trust values are never modified; weights are a separate, derived vector.
struct WeightingPolicy {
  // Exponential boost relative to the best trust value:
  //   w_i = exp(beta * (v_i - v_max) / sigma), normalised so the best is 1.
  // If sigma is ~0 every participant at the maximum gets 1 and the rest 0.
  bool boost{true};
  double beta{5.0};

  // Route `burn_fraction` of the total weight to `burn_participant`; the
  // remaining participants share 1 - burn_fraction in proportion to their
  // (boosted) weight.
  bool burn{false};
  double burn_fraction{0.9};
  std::string burn_participant{"0"};
};

std::vector<std::string> validate_weighting_policy(const WeightingPolicy& policy);

// Boost transform on a plain vector of raw values (population std-dev).
std::vector<double> boost_values(const std::vector<double>& raw, double beta);

std::map<std::string, double> compute_publication_weights(const TrustSnapshot& snapshot,
                                                          const WeightingPolicy& policy);

// Convenience: fills snapshot.weights.
void attach_publication_weights(TrustSnapshot& snapshot, const WeightingPolicy& policy);

} // namespace aerojudge
