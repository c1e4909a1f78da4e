#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "aerojudge/core/config.h"
#include "aerojudge/core/map_generator.h"
#include "aerojudge/core/replay_engine.h"
#include "aerojudge/core/reward.h"
#include "aerojudge/core/serialization.h"
#include "aerojudge/core/trust.h"
#include "aerojudge/core/weighting.h"
#include "aerojudge/util/digest.h"
#include "aerojudge/util/file_io.h"
#include "aerojudge/util/json.h"
#include "aerojudge/util/log.h"
#include "aerojudge/util/strings.h"

namespace {

#ifndef AEROJUDGE_VERSION
#define AEROJUDGE_VERSION "unknown"
#endif

std::uint64_t get_u64_arg(int argc, char** argv, const std::string& key, std::uint64_t def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return static_cast<std::uint64_t>(std::stoull(argv[i + 1], nullptr, 0));
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "aerojudge CLI v" << AEROJUDGE_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "aerojudge_cli") << " <mode> [options]\n\n";
  std::cout << "Modes:\n";
  std::cout << "  --generate       Generate a challenge (--seed N, --tier T, optional --out PATH)\n";
  std::cout << "  --replay         Replay a flight plan (--spec PATH, --plan PATH, optional --out PATH)\n";
  std::cout << "  --score          Score a stored replay result (--result PATH)\n";
  std::cout << "  --trust          Print a trust checkpoint with publication weights (--state PATH)\n";
  std::cout << "  --update-trust   Fold one round of scores into a checkpoint (--state PATH, --scores PATH)\n";
  std::cout << "                   Scores file: {\"participant-id\": score, ...}\n";
  std::cout << "  --validate-config  Validate an arbiter config (--config PATH) and exit\n";
  std::cout << "  --print-default-config  Print the default arbiter config JSON\n\n";
  std::cout << "Options:\n";
  std::cout << "  --seed N         Challenge seed (decimal or 0x-prefixed hex, default: 1)\n";
  std::cout << "  --tier T         Difficulty tier (0-3 or novice|intermediate|advanced|expert, default: 0)\n";
  std::cout << "  --config PATH    Arbiter config JSON (capability allow-list, limits, trust, weighting)\n";
  std::cout << "  --log-level L    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet          Suppress non-essential output\n";
  std::cout << "  -h, --help       Show this help\n";
  std::cout << "  --version        Print version and exit\n";
}

void emit_json(const aerojudge::json::Value& v, const std::string& out_path, bool quiet) {
  const std::string text = aerojudge::json::stringify(v, 2) + "\n";
  if (out_path.empty()) {
    std::cout << text;
    return;
  }
  aerojudge::write_text_file(out_path, text);
  if (!quiet) std::cout << "Wrote " << out_path << "\n";
}

aerojudge::ArbiterConfig config_or_default(const std::string& path) {
  if (path.empty()) return aerojudge::ArbiterConfig{};
  return aerojudge::load_config(path);
}

int run_generate(int argc, char** argv, bool quiet) {
  const std::uint64_t seed = get_u64_arg(argc, argv, "--seed", 1);
  aerojudge::DifficultyTier tier = aerojudge::DifficultyTier::Novice;
  const std::string tier_text = get_str_arg(argc, argv, "--tier", "0");
  if (!aerojudge::parse_difficulty_tier(tier_text, tier)) {
    std::cerr << "Unknown --tier: '" << tier_text << "'\n";
    return 2;
  }

  const aerojudge::ChallengeSpec spec = aerojudge::generate_challenge(seed, tier);
  emit_json(aerojudge::challenge_to_json(spec), get_str_arg(argc, argv, "--out", ""), quiet);
  if (!quiet) {
    const aerojudge::Vec3 goal = spec.goal.position_at(0.0);
    std::cerr << "challenge " << aerojudge::digest64_to_hex(aerojudge::challenge_id(spec)) << ": "
              << aerojudge::difficulty_tier_label(tier) << ", " << spec.obstacles.size() << " obstacles, "
              << spec.no_fly_zones.size() << " no-fly zones, goal "
              << aerojudge::format_fixed(aerojudge::distance(spec.start, goal), 1) << " m away ("
              << aerojudge::motion_kind_label(aerojudge::motion_kind(spec.goal.motion)) << ")\n";
  }
  return 0;
}

int run_replay(int argc, char** argv, bool quiet) {
  const std::string spec_path = get_str_arg(argc, argv, "--spec", "");
  const std::string plan_path = get_str_arg(argc, argv, "--plan", "");
  if (spec_path.empty() || plan_path.empty()) {
    std::cerr << "--replay requires both --spec and --plan\n";
    return 2;
  }
  const aerojudge::ArbiterConfig cfg = config_or_default(get_str_arg(argc, argv, "--config", ""));
  const auto spec = aerojudge::deserialize_challenge(aerojudge::read_text_file(spec_path));
  const auto plan = aerojudge::deserialize_flight_plan(aerojudge::read_text_file(plan_path));

  const aerojudge::ReplayEngine engine(cfg.replay);
  const aerojudge::ReplayResult result = engine.replay(spec, plan);
  const aerojudge::ScoreBreakdown b = aerojudge::score_breakdown(result);

  aerojudge::json::Object out;
  out["result"] = aerojudge::replay_result_to_json(result);
  out["score"] = aerojudge::score_breakdown_to_json(b);
  emit_json(aerojudge::json::Value(std::move(out)), get_str_arg(argc, argv, "--out", ""), quiet);
  if (!quiet) {
    std::cerr << aerojudge::termination_reason_label(result.termination_reason) << " after "
              << aerojudge::format_seconds(result.elapsed_s) << ", score " << aerojudge::format_fixed(b.total)
              << "\n";
  }
  return 0;
}

int run_score(int argc, char** argv) {
  const std::string result_path = get_str_arg(argc, argv, "--result", "");
  if (result_path.empty()) {
    std::cerr << "--score requires --result\n";
    return 2;
  }
  const std::string text = aerojudge::read_text_file(result_path);
  const aerojudge::json::Value root = aerojudge::json::parse(text);
  // Accept both a bare result and the {"result": ...} document --replay writes.
  const aerojudge::json::Value* inner = root.find("result");
  const aerojudge::ReplayResult result = aerojudge::replay_result_from_json(inner ? *inner : root);
  emit_json(aerojudge::score_breakdown_to_json(aerojudge::score_breakdown(result)), "", true);
  return 0;
}

int run_trust(int argc, char** argv, bool quiet) {
  const std::string state_path = get_str_arg(argc, argv, "--state", "");
  if (state_path.empty()) {
    std::cerr << "--trust requires --state\n";
    return 2;
  }
  const aerojudge::ArbiterConfig cfg = config_or_default(get_str_arg(argc, argv, "--config", ""));
  aerojudge::TrustSnapshot snap = aerojudge::snapshot_of(aerojudge::load_trust_state(state_path));
  aerojudge::attach_publication_weights(snap, cfg.weighting);
  emit_json(aerojudge::trust_snapshot_to_json(snap), get_str_arg(argc, argv, "--out", ""), quiet);
  return 0;
}

int run_update_trust(int argc, char** argv, bool quiet) {
  const std::string state_path = get_str_arg(argc, argv, "--state", "");
  const std::string scores_path = get_str_arg(argc, argv, "--scores", "");
  if (state_path.empty() || scores_path.empty()) {
    std::cerr << "--update-trust requires both --state and --scores\n";
    return 2;
  }
  const aerojudge::ArbiterConfig cfg = config_or_default(get_str_arg(argc, argv, "--config", ""));

  aerojudge::TrustState initial;
  if (aerojudge::file_exists(state_path)) initial = aerojudge::load_trust_state(state_path);

  std::map<std::string, aerojudge::ParticipantScore> scores;
  const aerojudge::json::Value root = aerojudge::json::parse(aerojudge::read_text_file(scores_path));
  for (const auto& [id, v] : root.object()) {
    if (!v.is_number()) {
      std::cerr << "Score for '" << id << "' is not a number\n";
      return 2;
    }
    scores[id] = v.number_value();
  }

  aerojudge::TrustStore store(std::move(initial));
  aerojudge::TrustAggregator agg(store, cfg.trust);
  const aerojudge::TrustSnapshot snap = agg.update(scores);
  aerojudge::save_trust_state(store.state(), state_path);
  if (!quiet) {
    std::cout << "Round " << snap.round_index << ": " << scores.size() << " scored, " << snap.entries.size()
              << " participants, saved to " << state_path << "\n";
  }
  return 0;
}

int run_validate_config(int argc, char** argv, bool quiet) {
  const std::string path = get_str_arg(argc, argv, "--config", "");
  if (path.empty()) {
    std::cerr << "--validate-config requires --config\n";
    return 2;
  }
  try {
    (void)aerojudge::load_config(path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  if (!quiet) std::cout << "Config OK\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << AEROJUDGE_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h") || argc < 2) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_text = get_str_arg(argc, argv, "--log-level", "");
    if (!level_text.empty()) {
      aerojudge::log::Level lvl = aerojudge::log::Level::Info;
      if (!aerojudge::log::parse_level(level_text, lvl)) {
        std::cerr << "Unknown --log-level: '" << level_text << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      aerojudge::log::set_level(lvl);
    }

    const bool quiet = has_flag(argc, argv, "--quiet");

    if (has_flag(argc, argv, "--generate")) return run_generate(argc, argv, quiet);
    if (has_flag(argc, argv, "--replay")) return run_replay(argc, argv, quiet);
    if (has_flag(argc, argv, "--score")) return run_score(argc, argv);
    if (has_flag(argc, argv, "--trust")) return run_trust(argc, argv, quiet);
    if (has_flag(argc, argv, "--update-trust")) return run_update_trust(argc, argv, quiet);
    if (has_flag(argc, argv, "--validate-config")) return run_validate_config(argc, argv, quiet);
    if (has_flag(argc, argv, "--print-default-config")) {
      emit_json(aerojudge::config_to_json(aerojudge::ArbiterConfig{}), "", true);
      return 0;
    }

    std::cerr << "No mode given\n\n";
    print_usage(argv[0]);
    return 2;
  } catch (const std::exception& e) {
    aerojudge::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
