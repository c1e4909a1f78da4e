#include "aerojudge/core/weighting.h"

#include <algorithm>
#include <cmath>

namespace aerojudge {

std::vector<std::string> validate_weighting_policy(const WeightingPolicy& policy) {
  std::vector<std::string> errors;
  if (!std::isfinite(policy.beta) || policy.beta <= 0.0) errors.push_back("weighting.beta must be > 0");
  if (!std::isfinite(policy.burn_fraction) || policy.burn_fraction < 0.0 || policy.burn_fraction > 1.0) {
    errors.push_back("weighting.burn_fraction must be in [0, 1]");
  }
  if (policy.burn && policy.burn_participant.empty()) {
    errors.push_back("weighting.burn_participant must be set when burn is enabled");
  }
  return errors;
}

std::vector<double> boost_values(const std::vector<double>& raw, double beta) {
  std::vector<double> out(raw.size(), 0.0);
  if (raw.empty()) return out;

  const double vmax = *std::max_element(raw.begin(), raw.end());
  double mean = 0.0;
  for (double v : raw) mean += v;
  mean /= static_cast<double>(raw.size());
  double var = 0.0;
  for (double v : raw) var += (v - mean) * (v - mean);
  const double sigma = std::sqrt(var / static_cast<double>(raw.size()));

  if (sigma < 1e-9) {
    for (std::size_t i = 0; i < raw.size(); ++i) out[i] = (raw[i] == vmax) ? 1.0 : 0.0;
    return out;
  }

  double wmax = 0.0;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    out[i] = std::exp(beta * (raw[i] - vmax) / sigma);
    wmax = std::max(wmax, out[i]);
  }
  if (wmax > 0.0) {
    for (double& w : out) w /= wmax;
  }
  return out;
}

std::map<std::string, double> compute_publication_weights(const TrustSnapshot& snapshot,
                                                          const WeightingPolicy& policy) {
  std::vector<std::string> ids;
  std::vector<double> raw;
  ids.reserve(snapshot.entries.size());
  raw.reserve(snapshot.entries.size());
  for (const auto& e : snapshot.entries) {
    // The burn participant's weight is set explicitly below.
    if (policy.burn && e.id == policy.burn_participant) continue;
    ids.push_back(e.id);
    raw.push_back(e.value);
  }

  std::vector<double> w = policy.boost ? boost_values(raw, policy.beta) : raw;

  if (policy.burn) {
    double total = 0.0;
    for (double v : w) total += v;
    const double keep = 1.0 - policy.burn_fraction;
    for (double& v : w) v = (total > 0.0) ? v * keep / total : 0.0;
  }

  std::map<std::string, double> out;
  for (std::size_t i = 0; i < ids.size(); ++i) out[ids[i]] = w[i];
  if (policy.burn) out[policy.burn_participant] = policy.burn_fraction;
  return out;
}

void attach_publication_weights(TrustSnapshot& snapshot, const WeightingPolicy& policy) {
  snapshot.weights = compute_publication_weights(snapshot, policy);
}

} // namespace aerojudge
