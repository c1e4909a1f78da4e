#pragma once

#include <string>
#include <vector>

#include "aerojudge/core/replay_engine.h"
#include "aerojudge/core/round_scheduler.h"
#include "aerojudge/core/trust.h"
#include "aerojudge/core/weighting.h"
#include "aerojudge/util/json.h"
#include "aerojudge/util/log.h"

namespace aerojudge {

// Everything an arbiter process needs, with documented defaults.
//
// JSON layout (every section and key optional):
//   {
//     "log_level": "info",
//     "scheduler": {"secret_seed": "<hex>", "tier_schedule": ["novice", ...],
//                   "sample_k": 256, "collect_timeout_ms": 30000,
//                   "round_sleep_ms": 300000, "replay_workers": 0,
//                   "first_round": 0, "checkpoint_path": "",
//                   "audit": {"enabled": false, "dir": "audit",
//                             "prefix": "round_", "keep_files": 256}},
//     "trust": {"alpha": 0.2, "initial_trust": 0.5},
//     "weighting": {"boost": true, "beta": 5, "burn": false,
//                   "burn_fraction": 0.9, "burn_participant": "0"},
//     "replay": {"max_samples": 20000, "timestamp_slack_s": 1.0,
//                "max_steps": 2000000},
//     "capabilities": [{"model": ..., "mass_kg": ..., ...}]
//   }
//
// A "capabilities" array replaces the built-in allow-list.
struct ArbiterConfig {
  log::Level log_level{log::Level::Info};
  SchedulerConfig scheduler;
  TrustConfig trust;
  WeightingPolicy weighting;
  ReplayConfig replay;
};

// Empty => valid.
std::vector<std::string> validate_config(const ArbiterConfig& cfg);

// Reads keys present in `v` on top of defaults. Throws std::runtime_error on
// type errors. Unknown keys are appended to `warnings` if provided.
ArbiterConfig config_from_json(const json::Value& v, std::vector<std::string>* warnings = nullptr);
json::Value config_to_json(const ArbiterConfig& cfg);

// Parse + validate. Throws std::runtime_error listing every problem.
ArbiterConfig load_config(const std::string& path);

} // namespace aerojudge
