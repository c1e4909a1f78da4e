#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "aerojudge/core/config.h"
#include "aerojudge/util/file_io.h"
#include "aerojudge/util/json.h"

#define AJ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool load_fails_with(const std::string& path, const std::string& needle) {
  try {
    (void)aerojudge::load_config(path);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

} // namespace

int test_config() {
  using namespace aerojudge;
  namespace fs = std::filesystem;

  // Defaults are valid and match the documented values.
  {
    const ArbiterConfig cfg;
    AJ_ASSERT(validate_config(cfg).empty());
    AJ_ASSERT(cfg.trust.alpha == 0.2);
    AJ_ASSERT(cfg.scheduler.sample_k == 256);
    AJ_ASSERT(cfg.scheduler.collect_timeout == std::chrono::milliseconds(30000));
    AJ_ASSERT(cfg.scheduler.round_sleep == std::chrono::milliseconds(300000));
    AJ_ASSERT(cfg.replay.registry.find("quad-standard") != nullptr);
  }

  // The printed default config reads back to the same values.
  {
    const ArbiterConfig defaults;
    std::vector<std::string> warnings;
    const ArbiterConfig back = config_from_json(config_to_json(defaults), &warnings);
    AJ_ASSERT(warnings.empty());
    AJ_ASSERT(back.scheduler.secret_seed == defaults.scheduler.secret_seed);
    AJ_ASSERT(back.scheduler.tier_schedule == defaults.scheduler.tier_schedule);
    AJ_ASSERT(back.weighting.beta == defaults.weighting.beta);
    AJ_ASSERT(back.replay.registry.models() == defaults.replay.registry.models());
    AJ_ASSERT(back.log_level == defaults.log_level);
  }

  // Partial documents override only what they name; unknown keys warn.
  {
    const json::Value v = json::parse(
        "{\"log_level\": \"debug\", \"trust\": {\"alpha\": 0.5}, \"scheduler\": {\"sample_k\": 8, "
        "\"tier_schedule\": [\"expert\", 0], \"secret_seed\": \"ff\", \"colour\": \"red\"}, \"extra\": 1}");
    std::vector<std::string> warnings;
    const ArbiterConfig cfg = config_from_json(v, &warnings);
    AJ_ASSERT(cfg.log_level == log::Level::Debug);
    AJ_ASSERT(cfg.trust.alpha == 0.5);
    AJ_ASSERT(cfg.trust.initial_trust == 0.5);
    AJ_ASSERT(cfg.scheduler.sample_k == 8);
    AJ_ASSERT(cfg.scheduler.secret_seed == 255);
    AJ_ASSERT(cfg.scheduler.tier_schedule.size() == 2);
    AJ_ASSERT(cfg.scheduler.tier_schedule[0] == DifficultyTier::Expert);
    AJ_ASSERT(cfg.scheduler.tier_schedule[1] == DifficultyTier::Novice);
    AJ_ASSERT(warnings.size() == 2);
  }

  // A capabilities list replaces the built-in allow-list.
  {
    const json::Value v = json::parse(
        "{\"capabilities\": [{\"model\": \"lab-quad\", \"mass_kg\": 1.2, \"max_thrust_n\": 30, "
        "\"max_torque_nm\": 0.6, \"battery_capacity_j\": 50000, \"watts_per_newton\": 14, "
        "\"watts_per_newton_metre\": 18, \"body_radius_m\": 0.25}]}");
    const ArbiterConfig cfg = config_from_json(v);
    AJ_ASSERT(cfg.replay.registry.models().size() == 1);
    AJ_ASSERT(cfg.replay.registry.find("lab-quad")->max_thrust_n == 30.0);
    AJ_ASSERT(cfg.replay.registry.find("quad-standard") == nullptr);
  }

  // Type errors throw while reading.
  {
    bool threw = false;
    try {
      (void)config_from_json(json::parse("{\"trust\": {\"alpha\": \"high\"}}"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AJ_ASSERT(threw);

    // Integers that JSON cannot hold exactly are type errors too.
    for (const char* text : {"{\"scheduler\": {\"sample_k\": 1e300}}", "{\"scheduler\": {\"first_round\": -1e19}}",
                             "{\"replay\": {\"max_steps\": 2.5}}"}) {
      bool rejected = false;
      try {
        (void)config_from_json(json::parse(text));
      } catch (const std::runtime_error&) {
        rejected = true;
      }
      AJ_ASSERT(rejected);
    }
  }

  // load_config validates and lists every problem.
  {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "aerojudge_test_config";
    dir /= std::to_string(static_cast<long long>(nonce));
    const std::string path = (dir / "arbiter.json").string();

    write_text_file(path, "{\"trust\": {\"alpha\": 0}}");
    AJ_ASSERT(load_fails_with(path, "trust.alpha"));

    write_text_file(path, "{\"trust\": {\"alpha\": 1.7}, \"weighting\": {\"beta\": -1}}");
    AJ_ASSERT(load_fails_with(path, "trust.alpha"));
    AJ_ASSERT(load_fails_with(path, "weighting.beta"));

    write_text_file(path, "{\"scheduler\": {\"tier_schedule\": []}}");
    AJ_ASSERT(load_fails_with(path, "tier_schedule"));

    write_text_file(path, "{\"capabilities\": []}");
    AJ_ASSERT(load_fails_with(path, "capabilities"));

    write_text_file(path, "{\"trust\": {\"alpha\": 0.3}, \"scheduler\": {\"checkpoint_path\": \"trust.json\"}}");
    const ArbiterConfig ok = load_config(path);
    AJ_ASSERT(ok.trust.alpha == 0.3);
    AJ_ASSERT(ok.scheduler.checkpoint_path == "trust.json");

    fs::remove_all(dir, ec);
  }

  return 0;
}
