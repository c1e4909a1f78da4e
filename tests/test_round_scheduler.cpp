#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "aerojudge/core/map_generator.h"
#include "aerojudge/core/round_scheduler.h"
#include "aerojudge/core/serialization.h"
#include "aerojudge/util/file_io.h"
#include "aerojudge/util/json.h"
#include "aerojudge/util/log.h"

#define AJ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace aerojudge;

ChallengeSpec open_field() {
  ChallengeSpec s;
  s.seed = 1;
  s.world_bounds = {{-50.0, -50.0, 0.0}, {50.0, 50.0, 40.0}};
  s.start = {0.0, 0.0, 5.0};
  s.goal.anchor = {10.0, 0.0, 5.0};
  s.capture_radius_m = 1.0;
  s.capture_hold_s = 0.0;
  s.reference_time_s = 5.0;
  s.horizon_s = 20.0;
  return s;
}

ChallengeSpec open_field_source(std::uint64_t, DifficultyTier) { return open_field(); }

// How a scripted participant answers a challenge.
enum class Behaviour { Push, Hover, WrongChallenge, Silent };

FlightPlan plan_for(const ChallengeSpec& spec, Behaviour b) {
  FlightPlan p;
  p.challenge_id = challenge_id(spec) + (b == Behaviour::WrongChallenge ? 1 : 0);
  p.declared_capability = *CapabilityRegistry::defaults().find("quad-standard");
  const Vec3 thrust = b == Behaviour::Push ? Vec3{2.0, 0.0, 9.81} : Vec3{0.0, 0.0, 9.81};
  p.control_sequence.push_back({0.0, thrust, 0.0});
  return p;
}

class ScriptedDispatch : public DispatchChannel {
 public:
  std::map<std::string, Behaviour> script;
  // Extra responses from ids that were never dispatched.
  std::vector<std::string> intruders;
  bool fail_broadcast{false};
  bool fail_collect{false};

  int broadcasts{0};
  std::set<std::string> last_roster;
  std::optional<ChallengeSpec> last_challenge;

  std::vector<DispatchHandle> broadcast(const ChallengeSpec& challenge,
                                        const std::set<std::string>& participant_ids) override {
    if (fail_broadcast) throw std::runtime_error("transport down");
    ++broadcasts;
    last_roster = participant_ids;
    last_challenge = challenge;
    std::vector<DispatchHandle> handles;
    std::uint64_t token = 0;
    for (const auto& id : participant_ids) handles.push_back(DispatchHandle{id, challenge_id(challenge), ++token});
    return handles;
  }

  std::map<std::string, std::optional<FlightPlan>> collect(const std::vector<DispatchHandle>& handles,
                                                           std::chrono::steady_clock::time_point) override {
    if (fail_collect) throw std::runtime_error("collector crashed");
    std::map<std::string, std::optional<FlightPlan>> out;
    for (const auto& h : handles) {
      const auto it = script.find(h.participant_id);
      if (it == script.end() || it->second == Behaviour::Silent) {
        out[h.participant_id] = std::nullopt;
        continue;
      }
      out[h.participant_id] = plan_for(*last_challenge, it->second);
    }
    for (const auto& id : intruders) out[id] = plan_for(*last_challenge, Behaviour::Push);
    return out;
  }
};

class ScriptedLedger : public LedgerClient {
 public:
  std::set<std::string> ids;
  bool accept{true};
  bool throw_on_publish{false};
  bool throw_on_query{false};
  std::function<void()> on_publish;

  std::atomic<int> publishes{0};
  std::vector<TrustSnapshot> published;

  bool publish(const TrustSnapshot& snapshot) override {
    if (on_publish) on_publish();
    if (throw_on_publish) throw std::runtime_error("ledger unreachable");
    if (!accept) return false;
    published.push_back(snapshot);
    ++publishes;
    return true;
  }

  std::set<std::string> current_participant_ids() override {
    if (throw_on_query) throw std::runtime_error("registry timeout");
    return ids;
  }
};

SchedulerConfig fast_config() {
  SchedulerConfig cfg;
  cfg.sample_k = 0;
  cfg.collect_timeout = std::chrono::milliseconds(50);
  cfg.round_sleep = std::chrono::milliseconds(1);
  cfg.replay_workers = 2;
  return cfg;
}

struct QuietLog {
  aerojudge::log::Level saved{aerojudge::log::level()};
  QuietLog() { aerojudge::log::set_level(aerojudge::log::Level::Off); }
  ~QuietLog() { aerojudge::log::set_level(saved); }
};

} // namespace

int test_round_scheduler() {
  const QuietLog quiet;

  // A full round: scored responders, a non-responder charged the minimum,
  // an invalid plan isolated to that participant.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}, {"bob", Behaviour::Hover}, {"dave", Behaviour::WrongChallenge}};
    ScriptedLedger ledger;
    ledger.ids = {"alice", "bob", "carol", "dave"};

    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);
    AJ_ASSERT(sched.next_round_index() == 0);

    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Published);
    AJ_ASSERT(!report.failed_phase.has_value());
    AJ_ASSERT(report.round_index == 0);
    AJ_ASSERT(report.challenge_id == challenge_id(open_field()));
    AJ_ASSERT(report.participants.size() == 4);

    const ParticipantOutcome& alice = report.participants.at("alice");
    AJ_ASSERT(alice.responded && alice.result && alice.result->goal_reached);
    AJ_ASSERT(alice.score > RewardPolicy::kSurvivalScore);
    AJ_ASSERT(report.participants.at("bob").result->termination_reason == TerminationReason::Timeout);
    AJ_ASSERT(report.participants.at("bob").score == RewardPolicy::kSurvivalScore);
    AJ_ASSERT(!report.participants.at("carol").responded);
    AJ_ASSERT(!report.participants.at("carol").result.has_value());
    AJ_ASSERT(report.participants.at("dave").result->termination_reason == TerminationReason::InvalidInput);
    AJ_ASSERT(report.participants.at("dave").score == RewardPolicy::kMinScore);

    // Published then committed.
    AJ_ASSERT(ledger.publishes.load() == 1);
    AJ_ASSERT(store.last_round() == 0);
    AJ_ASSERT(store.size() == 4);
    const TrustSnapshot snap = store.snapshot();
    AJ_ASSERT(snap.find("alice")->value > snap.find("bob")->value);
    AJ_ASSERT(snap.find("bob")->value > snap.find("carol")->value);
    AJ_ASSERT(snap.find("carol")->value == snap.find("dave")->value);

    AJ_ASSERT(report.snapshot.has_value());
    AJ_ASSERT(report.snapshot->round_index == 0);
    AJ_ASSERT(report.snapshot->weights.at("alice") == 1.0);
    AJ_ASSERT(ledger.published[0].weights.size() == 4);

    AJ_ASSERT(sched.next_round_index() == 1);
    AJ_ASSERT(sched.rounds_published() == 1);
    AJ_ASSERT(sched.phase() == RoundPhase::Idle);
  }

  // A refused or failing publish leaves the trust state untouched.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}};
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    ledger.accept = false;

    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);

    RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Abandoned);
    AJ_ASSERT(report.failed_phase && *report.failed_phase == RoundPhase::Publishing);
    AJ_ASSERT(!report.snapshot.has_value());
    AJ_ASSERT(store.last_round() == -1);
    AJ_ASSERT(store.size() == 0);

    ledger.throw_on_publish = true;
    report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Abandoned);
    AJ_ASSERT(report.error.find("unreachable") != std::string::npos);
    AJ_ASSERT(store.size() == 0);

    ledger.throw_on_publish = false;
    ledger.accept = true;
    report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Published);
    AJ_ASSERT(report.round_index == 2);
    AJ_ASSERT(store.last_round() == 2);
    AJ_ASSERT(sched.rounds_published() == 1);
  }

  // The store moving underneath a round makes its proposal stale.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}};
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    TrustState elsewhere;
    elsewhere.last_round = 40;
    elsewhere.entries["zed"] = TrustEntry{0.9, 40};
    ledger.on_publish = [&]() { store.restore(elsewhere); };

    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);
    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Abandoned);
    AJ_ASSERT(*report.failed_phase == RoundPhase::Aggregating);
    AJ_ASSERT(store.last_round() == 40);
    AJ_ASSERT(!store.contains("alice"));
  }

  // A replay pool that cannot run still finishes the round; responders get
  // the worst-case result instead of the process going down.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}, {"bob", Behaviour::Hover}};
    ScriptedLedger ledger;
    ledger.ids = {"alice", "bob", "carol"};
    ReplayConfig replay_cfg;
    replay_cfg.spawn_worker = [](std::function<void()>) -> std::thread {
      throw std::runtime_error("no threads left");
    };

    RoundScheduler sched(fast_config(), store, dispatch, ledger, TrustConfig{}, WeightingPolicy{}, replay_cfg);
    sched.set_challenge_source(open_field_source);
    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Published);
    for (const char* id : {"alice", "bob"}) {
      const ParticipantOutcome& out = report.participants.at(id);
      AJ_ASSERT(out.responded);
      AJ_ASSERT(out.result->termination_reason == TerminationReason::InvalidInput);
      AJ_ASSERT(out.result->invalid_reason.find("no threads left") != std::string::npos);
      AJ_ASSERT(out.score == RewardPolicy::kMinScore);
    }
    AJ_ASSERT(store.last_round() == 0);
    AJ_ASSERT(store.snapshot().find("alice")->value == store.snapshot().find("carol")->value);
  }

  // Generation failures abandon before anything is sent.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    RoundScheduler sched(fast_config(), store, dispatch, ledger);

    sched.set_challenge_source([](std::uint64_t, DifficultyTier) -> ChallengeSpec {
      throw GenerationError("no solvable layout");
    });
    RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Abandoned);
    AJ_ASSERT(*report.failed_phase == RoundPhase::Generating);
    AJ_ASSERT(report.error.find("solvable") != std::string::npos);

    sched.set_challenge_source([](std::uint64_t, DifficultyTier) {
      ChallengeSpec s = open_field();
      s.capture_radius_m = -1.0;
      return s;
    });
    report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Abandoned);
    AJ_ASSERT(*report.failed_phase == RoundPhase::Generating);
    AJ_ASSERT(dispatch.broadcasts == 0);
    AJ_ASSERT(ledger.publishes.load() == 0);

    // An empty source falls back to the built-in generator.
    sched.set_challenge_source(nullptr);
    report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Published);
    AJ_ASSERT(report.tier == tier_for_round(sched.config(), report.round_index));
    AJ_ASSERT(report.challenge_id == challenge_id(generate_challenge(report.seed, report.tier)));
  }

  // Transport and registry failures abandon the round.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);

    ledger.throw_on_query = true;
    AJ_ASSERT(*sched.run_one_round().failed_phase == RoundPhase::Dispatching);
    ledger.throw_on_query = false;

    dispatch.fail_broadcast = true;
    AJ_ASSERT(*sched.run_one_round().failed_phase == RoundPhase::Dispatching);
    dispatch.fail_broadcast = false;

    dispatch.fail_collect = true;
    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Abandoned);
    AJ_ASSERT(*report.failed_phase == RoundPhase::Collecting);
    AJ_ASSERT(store.size() == 0);
  }

  // A stop request before the round starts cancels it.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);
    sched.request_stop();
    AJ_ASSERT(sched.stop_requested());

    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Cancelled);
    AJ_ASSERT(*report.failed_phase == RoundPhase::Generating);
    AJ_ASSERT(dispatch.broadcasts == 0);
    AJ_ASSERT(store.last_round() == -1);
  }

  // Responses from participants that were not dispatched are dropped.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}};
    dispatch.intruders = {"mallory"};
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);

    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(report.status == RoundStatus::Published);
    AJ_ASSERT(report.participants.count("mallory") == 0);
    AJ_ASSERT(!store.contains("mallory"));
  }

  // Sampling is deterministic in the seed and bounded by k.
  {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) ids.insert("p" + std::to_string(i));

    const auto a = sample_participants(ids, 10, 1234);
    AJ_ASSERT(a.size() == 10);
    AJ_ASSERT(a == sample_participants(ids, 10, 1234));
    for (const auto& id : a) AJ_ASSERT(ids.count(id) == 1);

    bool differs = false;
    for (std::uint64_t seed = 1; seed <= 4; ++seed) differs = differs || (sample_participants(ids, 10, seed) != a);
    AJ_ASSERT(differs);

    AJ_ASSERT(sample_participants(ids, 0, 1) == ids);
    AJ_ASSERT(sample_participants(ids, 50, 1) == ids);
    AJ_ASSERT(sample_participants(ids, 500, 1) == ids);
    AJ_ASSERT(sample_participants({}, 3, 1).empty());

    // The scheduler only dispatches to the sample.
    TrustStore store;
    ScriptedDispatch dispatch;
    ScriptedLedger ledger;
    ledger.ids = ids;
    SchedulerConfig cfg = fast_config();
    cfg.sample_k = 5;
    RoundScheduler sched(cfg, store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);
    const RoundReport report = sched.run_one_round();
    AJ_ASSERT(dispatch.last_roster.size() == 5);
    AJ_ASSERT(dispatch.last_roster == sample_participants(ids, 5, report.seed));
    // Only the sample is charged for not answering.
    AJ_ASSERT(store.size() == 5);
  }

  // Round seeds and tiers.
  {
    AJ_ASSERT(derive_round_seed(7, 3) == derive_round_seed(7, 3));
    AJ_ASSERT(derive_round_seed(7, 3) != derive_round_seed(7, 4));
    AJ_ASSERT(derive_round_seed(7, 3) != derive_round_seed(8, 3));

    const SchedulerConfig cfg;
    AJ_ASSERT(tier_for_round(cfg, 0) == DifficultyTier::Novice);
    AJ_ASSERT(tier_for_round(cfg, 3) == DifficultyTier::Expert);
    AJ_ASSERT(tier_for_round(cfg, 5) == DifficultyTier::Intermediate);

    SchedulerConfig bad = fast_config();
    bad.tier_schedule.clear();
    AJ_ASSERT(!validate_scheduler_config(bad).empty());
    TrustStore store;
    ScriptedDispatch dispatch;
    ScriptedLedger ledger;
    bool threw = false;
    try {
      RoundScheduler sched(bad, store, dispatch, ledger);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AJ_ASSERT(threw);
  }

  // Round numbering resumes after the last committed round.
  {
    TrustState s;
    s.last_round = 7;
    s.entries["alice"] = TrustEntry{0.5, 7};
    TrustStore store(s);
    ScriptedDispatch dispatch;
    ScriptedLedger ledger;
    RoundScheduler resumed(fast_config(), store, dispatch, ledger);
    AJ_ASSERT(resumed.next_round_index() == 8);

    SchedulerConfig later = fast_config();
    later.first_round = 20;
    RoundScheduler jumped(later, store, dispatch, ledger);
    AJ_ASSERT(jumped.next_round_index() == 20);
  }

  // Checkpoints and audit records follow each published round.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "aerojudge_test_scheduler";
    dir /= std::to_string(static_cast<long long>(nonce));

    SchedulerConfig cfg = fast_config();
    cfg.checkpoint_path = (dir / "trust.json").string();
    cfg.audit.enabled = true;
    cfg.audit.dir = (dir / "audit").string();
    cfg.audit.keep_files = 2;

    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}, {"bob", Behaviour::Hover}};
    ScriptedLedger ledger;
    ledger.ids = {"alice", "bob"};
    RoundScheduler sched(cfg, store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);
    for (int i = 0; i < 3; ++i) AJ_ASSERT(sched.run_one_round().status == RoundStatus::Published);

    const TrustState saved = load_trust_state(cfg.checkpoint_path);
    AJ_ASSERT(saved.last_round == 2);
    AJ_ASSERT(saved.entries.at("alice").value == store.state().entries.at("alice").value);

    const AuditScanResult scan = scan_audit_records(cfg.audit);
    AJ_ASSERT(scan.ok);
    AJ_ASSERT(scan.files.size() == 2);
    AJ_ASSERT(scan.files[0].filename == audit_record_filename(cfg.audit, 2));

    const json::Value record = json::parse(read_text_file(scan.files[0].path));
    AJ_ASSERT(record.at("status").string_value() == "published");
    AJ_ASSERT(challenges_equal(challenge_from_json(record.at("challenge")), open_field()));
    const FlightPlan stored = flight_plan_from_json(record.at("participants").at("alice").at("plan"));
    AJ_ASSERT(stored.challenge_id == challenge_id(open_field()));

    fs::remove_all(dir, ec);
  }

  // run_forever keeps going until another thread asks it to stop.
  {
    TrustStore store;
    ScriptedDispatch dispatch;
    dispatch.script = {{"alice", Behaviour::Push}};
    ScriptedLedger ledger;
    ledger.ids = {"alice"};
    RoundScheduler sched(fast_config(), store, dispatch, ledger);
    sched.set_challenge_source(open_field_source);

    std::thread worker([&]() { sched.run_forever(std::chrono::milliseconds(1)); });
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (ledger.publishes.load() < 3 && std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    sched.request_stop();
    worker.join();

    AJ_ASSERT(ledger.publishes.load() >= 3);
    AJ_ASSERT(sched.rounds_published() >= 3);
    AJ_ASSERT(sched.phase() == RoundPhase::Idle);
    AJ_ASSERT(store.last_round() >= 2);
  }

  return 0;
}
