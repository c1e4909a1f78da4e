#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "aerojudge/core/challenge.h"
#include "aerojudge/core/collaborators.h"
#include "aerojudge/core/replay_engine.h"
#include "aerojudge/core/reward.h"
#include "aerojudge/core/trust.h"
#include "aerojudge/core/weighting.h"
#include "aerojudge/util/audit_log.h"

namespace aerojudge {

enum class RoundPhase : std::uint8_t {
  Idle = 0,
  Generating,
  Dispatching,
  Collecting,
  Replaying,
  Scoring,
  Aggregating,
  Publishing,
  Sleeping,
};

const char* round_phase_label(RoundPhase p);

enum class RoundStatus : std::uint8_t {
  // Trust vector published and committed.
  Published = 0,
  // A round-fatal phase failed; trust state unchanged.
  Abandoned,
  // Stop was requested before publication; trust state unchanged.
  Cancelled,
};

const char* round_status_label(RoundStatus s);

struct SchedulerConfig {
  // Secret base seed. Round seeds are derived from it, so participants cannot
  // predict future challenges without it.
  std::uint64_t secret_seed{0x6165726f6a756467ULL};

  // Tier of round i is tier_schedule[i % size]. Must not be empty.
  std::vector<DifficultyTier> tier_schedule{DifficultyTier::Novice, DifficultyTier::Intermediate,
                                            DifficultyTier::Advanced, DifficultyTier::Expert};

  // Participants sampled per round. 0 = everyone.
  std::size_t sample_k{256};

  // Hard deadline for collecting flight plans.
  std::chrono::milliseconds collect_timeout{30000};

  // Pause between rounds in run_forever().
  std::chrono::milliseconds round_sleep{300000};

  // Replay threads (0 = hardware concurrency).
  int replay_workers{0};

  // First round index; raised to last committed round + 1 if lower.
  std::int64_t first_round{0};

  // Trust checkpoint written after each commit. Empty = none.
  std::string checkpoint_path;

  AuditConfig audit;
};

std::vector<std::string> validate_scheduler_config(const SchedulerConfig& cfg);

struct ParticipantOutcome {
  bool responded{false};
  // Empty for non-responders.
  std::optional<ReplayResult> result;
  ParticipantScore score{RewardPolicy::kMinScore};
  std::uint64_t plan_digest{0};
};

struct RoundReport {
  std::int64_t round_index{0};
  std::uint64_t seed{0};
  DifficultyTier tier{DifficultyTier::Novice};
  std::uint64_t challenge_id{0};

  RoundStatus status{RoundStatus::Abandoned};
  std::optional<RoundPhase> failed_phase;
  std::string error;

  // Keyed by participant id; only dispatched participants appear.
  std::map<std::string, ParticipantOutcome> participants;

  // Published (and committed) snapshot. Empty unless status == Published.
  std::optional<TrustSnapshot> snapshot;
};

// Produces the challenge for a round. Defaults to generate_challenge().
using ChallengeSource = std::function<ChallengeSpec(std::uint64_t seed, DifficultyTier tier)>;

std::uint64_t derive_round_seed(std::uint64_t secret, std::int64_t round_index);
DifficultyTier tier_for_round(const SchedulerConfig& cfg, std::int64_t round_index);

// Deterministic sample of k ids (k == 0 or k >= size => all), driven by
// `seed` only.
std::set<std::string> sample_participants(const std::set<std::string>& ids, std::size_t k, std::uint64_t seed);

// Drives rounds end-to-end:
//
//   Idle -> Generating -> Dispatching -> Collecting -> Replaying -> Scoring
//        -> Aggregating -> Publishing -> Sleeping -> Idle
//
// Per-participant failures are isolated to a minimum score. Failures in
// Generating, Dispatching, Aggregating or Publishing abandon the round
// without touching the trust store. Trust is committed only after a
// successful publish.
class RoundScheduler {
 public:
  RoundScheduler(SchedulerConfig cfg, TrustStore& store, DispatchChannel& dispatch, LedgerClient& ledger,
                 TrustConfig trust_cfg = {}, WeightingPolicy weighting = {}, ReplayConfig replay_cfg = {});

  void set_challenge_source(ChallengeSource source);

  // Runs exactly one round (no sleep) and advances the round index.
  RoundReport run_one_round();

  // Runs rounds until request_stop(), sleeping `poll_interval` between them.
  void run_forever(std::chrono::milliseconds poll_interval);

  // Thread-safe. Wakes a sleeping scheduler; a round in flight is cancelled
  // at its next phase boundary unless it already published.
  void request_stop();
  bool stop_requested() const { return stop_.load(); }

  RoundPhase phase() const { return static_cast<RoundPhase>(phase_.load()); }
  std::int64_t next_round_index() const { return next_round_; }
  std::uint64_t rounds_published() const { return rounds_published_; }
  const SchedulerConfig& config() const { return cfg_; }

 private:
  void enter(RoundPhase p, std::int64_t round_index);
  bool cancelled(RoundReport& report, RoundPhase at);
  void abandon(RoundReport& report, RoundPhase at, const std::string& error);
  void write_audit(const RoundReport& report, const ChallengeSpec& spec,
                   const std::map<std::string, FlightPlan>& plans) const;

  SchedulerConfig cfg_;
  TrustStore& store_;
  DispatchChannel& dispatch_;
  LedgerClient& ledger_;
  TrustAggregator aggregator_;
  WeightingPolicy weighting_;
  ReplayEngine engine_;
  ChallengeSource source_;

  std::int64_t next_round_{0};
  std::uint64_t rounds_published_{0};

  std::atomic<int> phase_{static_cast<int>(RoundPhase::Idle)};
  std::atomic<bool> stop_{false};
  std::mutex sleep_mu_;
  std::condition_variable sleep_cv_;
};

} // namespace aerojudge
