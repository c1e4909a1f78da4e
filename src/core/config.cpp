#include "aerojudge/core/config.h"

#include <cmath>
#include <set>
#include <utility>
#include <stdexcept>

#include "aerojudge/core/serialization.h"
#include "aerojudge/util/digest.h"
#include "aerojudge/util/file_io.h"

namespace aerojudge {
namespace {

using json::Array;
using json::Object;
using json::Value;

void note_unknown_keys(const Value& v, const std::set<std::string>& known, const std::string& where,
                       std::vector<std::string>* warnings) {
  if (!warnings) return;
  for (const auto& kv : v.object()) {
    if (known.count(kv.first) == 0) warnings->push_back("unknown key '" + where + kv.first + "'");
  }
}

const Value* section(const Value& root, const std::string& key) {
  const Value* s = root.find(key);
  if (s && !s->is_object()) throw std::runtime_error("config section '" + key + "' must be an object");
  return s;
}

double read_number(const Value& v, const std::string& key, double def) {
  const Value* n = v.find(key);
  if (!n) return def;
  if (!n->is_number()) throw std::runtime_error("config key '" + key + "' must be a number");
  return n->number_value();
}

std::int64_t read_int(const Value& v, const std::string& key, std::int64_t def) {
  // Beyond 2^53 a JSON number no longer holds an exact integer.
  constexpr double kMaxExactInteger = 9007199254740992.0;
  const double d = read_number(v, key, static_cast<double>(def));
  if (!std::isfinite(d) || d != std::floor(d) || std::fabs(d) > kMaxExactInteger) {
    throw std::runtime_error("config key '" + key + "' must be an integer");
  }
  return static_cast<std::int64_t>(d);
}

bool read_bool(const Value& v, const std::string& key, bool def) {
  const Value* b = v.find(key);
  if (!b) return def;
  if (!b->is_bool()) throw std::runtime_error("config key '" + key + "' must be true or false");
  return b->bool_value();
}

std::string read_string(const Value& v, const std::string& key, const std::string& def) {
  const Value* s = v.find(key);
  if (!s) return def;
  if (!s->is_string()) throw std::runtime_error("config key '" + key + "' must be a string");
  return s->string_value();
}

void read_scheduler(const Value& v, SchedulerConfig& s, std::vector<std::string>* warnings) {
  note_unknown_keys(v,
                    {"secret_seed", "tier_schedule", "sample_k", "collect_timeout_ms", "round_sleep_ms",
                     "replay_workers", "first_round", "checkpoint_path", "audit"},
                    "scheduler.", warnings);

  if (const Value* seed = v.find("secret_seed")) {
    if (const std::string* hex = seed->as_string()) {
      if (!digest64_from_hex(*hex, s.secret_seed)) throw std::runtime_error("scheduler.secret_seed is not hex");
    } else {
      s.secret_seed = static_cast<std::uint64_t>(read_int(v, "secret_seed", 0));
    }
  }
  if (const Value* tiers = v.find("tier_schedule")) {
    s.tier_schedule.clear();
    for (const auto& t : tiers->array()) {
      DifficultyTier tier = DifficultyTier::Novice;
      const std::string text = t.is_number() ? std::to_string(t.int_value()) : t.string_value();
      if (!parse_difficulty_tier(text, tier)) throw std::runtime_error("unknown tier in tier_schedule: " + text);
      s.tier_schedule.push_back(tier);
    }
  }
  const std::int64_t k = read_int(v, "sample_k", static_cast<std::int64_t>(s.sample_k));
  if (k < 0) throw std::runtime_error("scheduler.sample_k must be >= 0");
  s.sample_k = static_cast<std::size_t>(k);
  s.collect_timeout = std::chrono::milliseconds(read_int(v, "collect_timeout_ms", s.collect_timeout.count()));
  s.round_sleep = std::chrono::milliseconds(read_int(v, "round_sleep_ms", s.round_sleep.count()));
  s.replay_workers = static_cast<int>(read_int(v, "replay_workers", s.replay_workers));
  s.first_round = read_int(v, "first_round", s.first_round);
  s.checkpoint_path = read_string(v, "checkpoint_path", s.checkpoint_path);

  if (const Value* a = v.find("audit")) {
    note_unknown_keys(*a, {"enabled", "dir", "prefix", "extension", "keep_files"}, "scheduler.audit.", warnings);
    s.audit.enabled = read_bool(*a, "enabled", s.audit.enabled);
    s.audit.dir = read_string(*a, "dir", s.audit.dir);
    s.audit.prefix = read_string(*a, "prefix", s.audit.prefix);
    s.audit.extension = read_string(*a, "extension", s.audit.extension);
    s.audit.keep_files = static_cast<int>(read_int(*a, "keep_files", s.audit.keep_files));
  }
}

} // namespace

std::vector<std::string> validate_config(const ArbiterConfig& cfg) {
  std::vector<std::string> errors = validate_scheduler_config(cfg.scheduler);
  for (auto& e : validate_trust_config(cfg.trust)) errors.push_back(std::move(e));
  for (auto& e : validate_weighting_policy(cfg.weighting)) errors.push_back(std::move(e));

  if (cfg.replay.limits.max_samples == 0) errors.push_back("replay.max_samples must be > 0");
  if (!std::isfinite(cfg.replay.limits.timestamp_slack_s) || cfg.replay.limits.timestamp_slack_s < 0.0) {
    errors.push_back("replay.timestamp_slack_s must be >= 0");
  }
  if (cfg.replay.limits.max_steps <= 0) errors.push_back("replay.max_steps must be > 0");

  if (cfg.replay.registry.empty()) errors.push_back("capabilities must list at least one drone model");
  for (const auto& model : cfg.replay.registry.models()) {
    const DroneCapability* c = cfg.replay.registry.find(model);
    const bool ok = !model.empty() && std::isfinite(c->mass_kg) && c->mass_kg > 0.0 &&
                    std::isfinite(c->max_thrust_n) && c->max_thrust_n > 0.0 && std::isfinite(c->max_torque_nm) &&
                    c->max_torque_nm >= 0.0 && std::isfinite(c->battery_capacity_j) &&
                    c->battery_capacity_j > 0.0 && std::isfinite(c->watts_per_newton) &&
                    c->watts_per_newton >= 0.0 && std::isfinite(c->watts_per_newton_metre) &&
                    c->watts_per_newton_metre >= 0.0 && std::isfinite(c->body_radius_m) && c->body_radius_m >= 0.0;
    if (!ok) errors.push_back("capability '" + model + "' has invalid physical parameters");
  }
  return errors;
}

ArbiterConfig config_from_json(const Value& v, std::vector<std::string>* warnings) {
  ArbiterConfig cfg;
  note_unknown_keys(v, {"log_level", "scheduler", "trust", "weighting", "replay", "capabilities"}, "", warnings);

  if (const Value* lvl = v.find("log_level")) {
    if (!log::parse_level(lvl->string_value(), cfg.log_level)) {
      throw std::runtime_error("unknown log_level: " + lvl->string_value());
    }
  }
  if (const Value* s = section(v, "scheduler")) read_scheduler(*s, cfg.scheduler, warnings);
  if (const Value* t = section(v, "trust")) {
    note_unknown_keys(*t, {"alpha", "initial_trust"}, "trust.", warnings);
    cfg.trust.alpha = read_number(*t, "alpha", cfg.trust.alpha);
    cfg.trust.initial_trust = read_number(*t, "initial_trust", cfg.trust.initial_trust);
  }
  if (const Value* w = section(v, "weighting")) {
    note_unknown_keys(*w, {"boost", "beta", "burn", "burn_fraction", "burn_participant"}, "weighting.", warnings);
    cfg.weighting.boost = read_bool(*w, "boost", cfg.weighting.boost);
    cfg.weighting.beta = read_number(*w, "beta", cfg.weighting.beta);
    cfg.weighting.burn = read_bool(*w, "burn", cfg.weighting.burn);
    cfg.weighting.burn_fraction = read_number(*w, "burn_fraction", cfg.weighting.burn_fraction);
    cfg.weighting.burn_participant = read_string(*w, "burn_participant", cfg.weighting.burn_participant);
  }
  if (const Value* r = section(v, "replay")) {
    note_unknown_keys(*r, {"max_samples", "timestamp_slack_s", "max_steps"}, "replay.", warnings);
    const std::int64_t max_samples =
        read_int(*r, "max_samples", static_cast<std::int64_t>(cfg.replay.limits.max_samples));
    if (max_samples < 0) throw std::runtime_error("replay.max_samples must be >= 0");
    cfg.replay.limits.max_samples = static_cast<std::size_t>(max_samples);
    cfg.replay.limits.timestamp_slack_s =
        read_number(*r, "timestamp_slack_s", cfg.replay.limits.timestamp_slack_s);
    cfg.replay.limits.max_steps = read_int(*r, "max_steps", cfg.replay.limits.max_steps);
  }
  if (const Value* caps = v.find("capabilities")) {
    CapabilityRegistry registry;
    for (const auto& c : caps->array()) registry.add(capability_from_json(c));
    cfg.replay.registry = std::move(registry);
  }
  return cfg;
}

Value config_to_json(const ArbiterConfig& cfg) {
  Object audit;
  audit["enabled"] = cfg.scheduler.audit.enabled;
  audit["dir"] = cfg.scheduler.audit.dir;
  audit["prefix"] = cfg.scheduler.audit.prefix;
  audit["extension"] = cfg.scheduler.audit.extension;
  audit["keep_files"] = static_cast<double>(cfg.scheduler.audit.keep_files);

  Array tiers;
  for (const auto t : cfg.scheduler.tier_schedule) tiers.push_back(std::string(difficulty_tier_label(t)));

  Object sched;
  sched["secret_seed"] = digest64_to_hex(cfg.scheduler.secret_seed);
  sched["tier_schedule"] = std::move(tiers);
  sched["sample_k"] = static_cast<double>(cfg.scheduler.sample_k);
  sched["collect_timeout_ms"] = static_cast<double>(cfg.scheduler.collect_timeout.count());
  sched["round_sleep_ms"] = static_cast<double>(cfg.scheduler.round_sleep.count());
  sched["replay_workers"] = static_cast<double>(cfg.scheduler.replay_workers);
  sched["first_round"] = static_cast<double>(cfg.scheduler.first_round);
  sched["checkpoint_path"] = cfg.scheduler.checkpoint_path;
  sched["audit"] = std::move(audit);

  Object trust;
  trust["alpha"] = cfg.trust.alpha;
  trust["initial_trust"] = cfg.trust.initial_trust;

  Object weighting;
  weighting["boost"] = cfg.weighting.boost;
  weighting["beta"] = cfg.weighting.beta;
  weighting["burn"] = cfg.weighting.burn;
  weighting["burn_fraction"] = cfg.weighting.burn_fraction;
  weighting["burn_participant"] = cfg.weighting.burn_participant;

  Object replay;
  replay["max_samples"] = static_cast<double>(cfg.replay.limits.max_samples);
  replay["timestamp_slack_s"] = cfg.replay.limits.timestamp_slack_s;
  replay["max_steps"] = static_cast<double>(cfg.replay.limits.max_steps);

  Array caps;
  for (const auto& model : cfg.replay.registry.models()) {
    caps.push_back(capability_to_json(*cfg.replay.registry.find(model)));
  }

  Object root;
  root["log_level"] = std::string(log::level_name(cfg.log_level));
  root["scheduler"] = std::move(sched);
  root["trust"] = std::move(trust);
  root["weighting"] = std::move(weighting);
  root["replay"] = std::move(replay);
  root["capabilities"] = std::move(caps);
  return root;
}

ArbiterConfig load_config(const std::string& path) {
  std::vector<std::string> warnings;
  ArbiterConfig cfg = config_from_json(json::parse(read_text_file(path)), &warnings);
  for (const auto& w : warnings) log::warn(path + ": " + w);

  const auto errors = validate_config(cfg);
  if (!errors.empty()) {
    std::string msg = "Invalid config " + path + ":";
    for (const auto& e : errors) msg += "\n  - " + e;
    throw std::runtime_error(msg);
  }
  return cfg;
}

} // namespace aerojudge
