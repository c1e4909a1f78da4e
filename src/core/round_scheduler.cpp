#include "aerojudge/core/round_scheduler.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "aerojudge/core/map_generator.h"
#include "aerojudge/core/serialization.h"
#include "aerojudge/util/digest.h"
#include "aerojudge/util/hash_rng.h"
#include "aerojudge/util/json.h"
#include "aerojudge/util/log.h"
#include "aerojudge/util/strings.h"

namespace aerojudge {
namespace {

constexpr std::uint64_t kSampleSalt = 0x73616d706c65ULL;

std::string round_tag(std::int64_t round_index) { return "Round " + std::to_string(round_index); }

} // namespace

const char* round_phase_label(RoundPhase p) {
  switch (p) {
    case RoundPhase::Idle: return "idle";
    case RoundPhase::Generating: return "generating";
    case RoundPhase::Dispatching: return "dispatching";
    case RoundPhase::Collecting: return "collecting";
    case RoundPhase::Replaying: return "replaying";
    case RoundPhase::Scoring: return "scoring";
    case RoundPhase::Aggregating: return "aggregating";
    case RoundPhase::Publishing: return "publishing";
    case RoundPhase::Sleeping: return "sleeping";
  }
  return "idle";
}

const char* round_status_label(RoundStatus s) {
  switch (s) {
    case RoundStatus::Published: return "published";
    case RoundStatus::Abandoned: return "abandoned";
    case RoundStatus::Cancelled: return "cancelled";
  }
  return "abandoned";
}

std::vector<std::string> validate_scheduler_config(const SchedulerConfig& cfg) {
  std::vector<std::string> errors;
  if (cfg.tier_schedule.empty()) errors.push_back("scheduler.tier_schedule must not be empty");
  if (cfg.collect_timeout.count() < 0) errors.push_back("scheduler.collect_timeout_ms must be >= 0");
  if (cfg.round_sleep.count() < 0) errors.push_back("scheduler.round_sleep_ms must be >= 0");
  if (cfg.replay_workers < 0) errors.push_back("scheduler.replay_workers must be >= 0");
  if (cfg.first_round < 0) errors.push_back("scheduler.first_round must be >= 0");
  if (cfg.audit.enabled && cfg.audit.dir.empty()) errors.push_back("scheduler.audit.dir must be set when enabled");
  return errors;
}

std::uint64_t derive_round_seed(std::uint64_t secret, std::int64_t round_index) {
  return util::derive_seed(secret, static_cast<std::uint64_t>(round_index));
}

DifficultyTier tier_for_round(const SchedulerConfig& cfg, std::int64_t round_index) {
  if (cfg.tier_schedule.empty()) return DifficultyTier::Novice;
  const auto n = static_cast<std::int64_t>(cfg.tier_schedule.size());
  const std::int64_t i = ((round_index % n) + n) % n;
  return cfg.tier_schedule[static_cast<std::size_t>(i)];
}

std::set<std::string> sample_participants(const std::set<std::string>& ids, std::size_t k, std::uint64_t seed) {
  if (k == 0 || k >= ids.size()) return ids;

  // Partial Fisher-Yates over the sorted id list.
  std::vector<std::string> pool(ids.begin(), ids.end());
  util::HashRng rng(util::derive_seed(seed, kSampleSalt));
  for (std::size_t i = 0; i < k; ++i) {
    const std::size_t j = i + static_cast<std::size_t>(rng.bounded(pool.size() - i));
    std::swap(pool[i], pool[j]);
  }
  return std::set<std::string>(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(k));
}

RoundScheduler::RoundScheduler(SchedulerConfig cfg, TrustStore& store, DispatchChannel& dispatch,
                               LedgerClient& ledger, TrustConfig trust_cfg, WeightingPolicy weighting,
                               ReplayConfig replay_cfg)
    : cfg_(std::move(cfg)),
      store_(store),
      dispatch_(dispatch),
      ledger_(ledger),
      aggregator_(store, trust_cfg),
      weighting_(std::move(weighting)),
      engine_(std::move(replay_cfg)),
      source_(generate_challenge) {
  const auto errors = validate_scheduler_config(cfg_);
  if (!errors.empty()) throw std::invalid_argument(errors.front());
  next_round_ = std::max(cfg_.first_round, store_.last_round() + 1);
}

void RoundScheduler::set_challenge_source(ChallengeSource source) {
  source_ = source ? std::move(source) : ChallengeSource(generate_challenge);
}

void RoundScheduler::enter(RoundPhase p, std::int64_t round_index) {
  phase_.store(static_cast<int>(p));
  log::debug(round_tag(round_index) + ": " + round_phase_label(p));
}

bool RoundScheduler::cancelled(RoundReport& report, RoundPhase at) {
  if (!stop_.load()) return false;
  report.status = RoundStatus::Cancelled;
  report.failed_phase = at;
  report.error = "stop requested";
  log::info(round_tag(report.round_index) + " cancelled before " + round_phase_label(at));
  return true;
}

void RoundScheduler::abandon(RoundReport& report, RoundPhase at, const std::string& error) {
  report.status = RoundStatus::Abandoned;
  report.failed_phase = at;
  report.error = error;
  report.snapshot.reset();
  log::error(round_tag(report.round_index) + " abandoned in " + round_phase_label(at) + ": " + error);
}

RoundReport RoundScheduler::run_one_round() {
  RoundReport report;
  report.round_index = next_round_++;
  report.seed = derive_round_seed(cfg_.secret_seed, report.round_index);
  report.tier = tier_for_round(cfg_, report.round_index);
  const std::int64_t r = report.round_index;

  struct PhaseReset {
    std::atomic<int>& phase;
    ~PhaseReset() { phase.store(static_cast<int>(RoundPhase::Idle)); }
  } phase_reset{phase_};

  // Generating
  if (cancelled(report, RoundPhase::Generating)) return report;
  enter(RoundPhase::Generating, r);
  ChallengeSpec spec;
  try {
    spec = source_(report.seed, report.tier);
  } catch (const std::exception& e) {
    abandon(report, RoundPhase::Generating, e.what());
    return report;
  }
  if (const auto errors = validate_challenge(spec); !errors.empty()) {
    abandon(report, RoundPhase::Generating, "generated challenge is invalid: " + errors.front());
    return report;
  }
  report.challenge_id = challenge_id(spec);

  // Dispatching
  if (cancelled(report, RoundPhase::Dispatching)) return report;
  enter(RoundPhase::Dispatching, r);
  std::set<std::string> roster;
  std::vector<DispatchHandle> handles;
  try {
    roster = sample_participants(ledger_.current_participant_ids(), cfg_.sample_k, report.seed);
    handles = dispatch_.broadcast(spec, roster);
  } catch (const std::exception& e) {
    abandon(report, RoundPhase::Dispatching, e.what());
    return report;
  }
  for (const auto& id : roster) report.participants[id] = ParticipantOutcome{};
  log::info(round_tag(r) + ": " + difficulty_tier_label(report.tier) + " challenge " +
            digest64_to_hex(report.challenge_id) + " sent to " + std::to_string(roster.size()) + " participants");

  // Collecting
  if (cancelled(report, RoundPhase::Collecting)) return report;
  enter(RoundPhase::Collecting, r);
  std::map<std::string, std::optional<FlightPlan>> responses;
  try {
    responses = dispatch_.collect(handles, std::chrono::steady_clock::now() + cfg_.collect_timeout);
  } catch (const std::exception& e) {
    abandon(report, RoundPhase::Collecting, e.what());
    return report;
  }

  std::vector<std::string> plan_ids;
  std::vector<FlightPlan> plans;
  for (auto& [id, plan] : responses) {
    if (roster.count(id) == 0) {
      log::warn(round_tag(r) + ": ignoring response from undispatched participant '" + id + "'");
      continue;
    }
    if (!plan) continue;
    plan_ids.push_back(id);
    plans.push_back(std::move(*plan));
  }
  log::debug(round_tag(r) + ": " + std::to_string(plans.size()) + "/" + std::to_string(roster.size()) +
             " responses before the deadline");

  // Replaying
  if (cancelled(report, RoundPhase::Replaying)) return report;
  enter(RoundPhase::Replaying, r);
  std::vector<ReplayResult> results;
  try {
    results = engine_.replay_batch(spec, plans, cfg_.replay_workers);
  } catch (const std::exception& e) {
    // Nothing was adjudicated; every responder gets the worst-case result.
    log::error(round_tag(r) + ": replay batch failed: " + e.what());
    results.clear();
    results.reserve(plans.size());
    for (const auto& plan : plans) {
      results.push_back(make_invalid_result(spec, plan.declared_capability, engine_.config().registry,
                                            std::string("replay failed: ") + e.what()));
    }
  }

  // Scoring
  if (cancelled(report, RoundPhase::Scoring)) return report;
  enter(RoundPhase::Scoring, r);
  std::map<std::string, ParticipantScore> scores;
  for (std::size_t i = 0; i < plans.size(); ++i) {
    ParticipantOutcome& out = report.participants[plan_ids[i]];
    out.responded = true;
    out.result = results[i];
    out.plan_digest = flight_plan_digest64(plans[i]);
    out.score = score(results[i]);
    if (results[i].termination_reason == TerminationReason::InvalidInput) {
      log::warn(round_tag(r) + ": participant '" + plan_ids[i] + "' submitted invalid input: " +
                results[i].invalid_reason);
    }
    scores[plan_ids[i]] = out.score;
  }

  // Aggregating
  if (cancelled(report, RoundPhase::Aggregating)) return report;
  enter(RoundPhase::Aggregating, r);
  TrustUpdate update;
  TrustSnapshot snapshot;
  try {
    update = aggregator_.propose(r, scores, &roster);
    snapshot = update.snapshot();
    attach_publication_weights(snapshot, weighting_);
  } catch (const std::exception& e) {
    abandon(report, RoundPhase::Aggregating, e.what());
    return report;
  }

  // Publishing
  if (cancelled(report, RoundPhase::Publishing)) return report;
  enter(RoundPhase::Publishing, r);
  bool published = false;
  try {
    published = ledger_.publish(snapshot);
  } catch (const std::exception& e) {
    abandon(report, RoundPhase::Publishing, e.what());
    return report;
  }
  if (!published) {
    abandon(report, RoundPhase::Publishing, "ledger rejected the trust vector");
    return report;
  }
  try {
    aggregator_.commit(update);
  } catch (const StaleProposalError& e) {
    abandon(report, RoundPhase::Aggregating, e.what());
    return report;
  }

  report.status = RoundStatus::Published;
  report.snapshot = std::move(snapshot);
  ++rounds_published_;
  log::info(round_tag(r) + " published: " + std::to_string(scores.size()) + " scored, " +
            std::to_string(update.absent.size()) + " absent");

  if (!cfg_.checkpoint_path.empty()) {
    try {
      save_trust_state(store_.state(), cfg_.checkpoint_path);
    } catch (const std::exception& e) {
      log::warn(round_tag(r) + ": trust checkpoint failed: " + e.what());
    }
  }
  if (cfg_.audit.enabled) {
    std::map<std::string, FlightPlan> by_id;
    for (std::size_t i = 0; i < plans.size(); ++i) by_id.emplace(plan_ids[i], plans[i]);
    write_audit(report, spec, by_id);
  }
  return report;
}

void RoundScheduler::write_audit(const RoundReport& report, const ChallengeSpec& spec,
                                 const std::map<std::string, FlightPlan>& plans) const {
  const AuditWriteResult res = write_audit_record(cfg_.audit, report.round_index, [&]() {
    return json::stringify(audit_record_to_json(report, spec, plans), 2) + "\n";
  });
  if (!res.saved) {
    log::warn(round_tag(report.round_index) + ": audit record not written: " + res.error);
  } else {
    log::debug(round_tag(report.round_index) + ": audit record " + res.path);
  }
}

void RoundScheduler::run_forever(std::chrono::milliseconds poll_interval) {
  log::info("Scheduler starting at round " + std::to_string(next_round_));
  while (!stop_.load()) {
    const RoundReport report = run_one_round();
    if (report.status != RoundStatus::Published) {
      log::debug(round_tag(report.round_index) + " ended " + round_status_label(report.status));
    }
    if (stop_.load()) break;

    phase_.store(static_cast<int>(RoundPhase::Sleeping));
    log::debug("Sleeping " + format_seconds(static_cast<double>(poll_interval.count()) / 1000.0));
    std::unique_lock lock(sleep_mu_);
    sleep_cv_.wait_for(lock, poll_interval, [this]() { return stop_.load(); });
    phase_.store(static_cast<int>(RoundPhase::Idle));
  }
  log::info("Scheduler stopped after " + std::to_string(rounds_published_) + " published rounds");
}

void RoundScheduler::request_stop() {
  {
    std::lock_guard lock(sleep_mu_);
    stop_.store(true);
  }
  sleep_cv_.notify_all();
}

} // namespace aerojudge
