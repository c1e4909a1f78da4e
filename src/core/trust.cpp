#include "aerojudge/core/trust.h"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <utility>

#include "aerojudge/core/serialization.h"
#include "aerojudge/util/file_io.h"
#include "aerojudge/util/json.h"

namespace aerojudge {
namespace {

double sanitize_score(double s) {
  if (!std::isfinite(s)) return RewardPolicy::kMinScore;
  return std::clamp(s, RewardPolicy::kMinScore, RewardPolicy::kMaxScore);
}

} // namespace

const TrustSnapshotEntry* TrustSnapshot::find(const std::string& id) const {
  const auto it = std::lower_bound(entries.begin(), entries.end(), id,
                                   [](const TrustSnapshotEntry& e, const std::string& key) { return e.id < key; });
  if (it == entries.end() || it->id != id) return nullptr;
  return &*it;
}

TrustSnapshot snapshot_of(const TrustState& state) {
  TrustSnapshot snap;
  snap.round_index = state.last_round;
  snap.entries.reserve(state.entries.size());
  // std::map iterates in key order, so entries come out sorted.
  for (const auto& [id, e] : state.entries) snap.entries.push_back({id, e.value, e.last_round});
  return snap;
}

TrustState TrustStore::state() const {
  std::shared_lock lock(mu_);
  return state_;
}

TrustSnapshot TrustStore::snapshot() const {
  std::shared_lock lock(mu_);
  return snapshot_of(state_);
}

std::int64_t TrustStore::last_round() const {
  std::shared_lock lock(mu_);
  return state_.last_round;
}

std::size_t TrustStore::size() const {
  std::shared_lock lock(mu_);
  return state_.entries.size();
}

bool TrustStore::contains(const std::string& id) const {
  std::shared_lock lock(mu_);
  return state_.entries.count(id) != 0;
}

void TrustStore::restore(TrustState state) {
  std::unique_lock lock(mu_);
  state_ = std::move(state);
}

std::vector<std::string> validate_trust_config(const TrustConfig& cfg) {
  std::vector<std::string> errors;
  if (!std::isfinite(cfg.alpha) || cfg.alpha <= 0.0 || cfg.alpha > 1.0) {
    errors.push_back("trust.alpha must be in (0, 1]");
  }
  if (!std::isfinite(cfg.initial_trust) || cfg.initial_trust < RewardPolicy::kMinScore ||
      cfg.initial_trust > RewardPolicy::kMaxScore) {
    errors.push_back("trust.initial_trust must be within the score range");
  }
  return errors;
}

TrustAggregator::TrustAggregator(TrustStore& store, TrustConfig cfg) : store_(store), cfg_(cfg) {
  const auto errors = validate_trust_config(cfg_);
  if (!errors.empty()) throw std::invalid_argument(errors.front());
}

TrustUpdate TrustAggregator::propose(std::int64_t round_index,
                                     const std::map<std::string, ParticipantScore>& round_scores,
                                     const std::set<std::string>* roster) const {
  TrustUpdate up;
  {
    std::shared_lock lock(store_.mu_);
    up.next = store_.state_;
  }
  up.base_round = up.next.last_round;
  up.round_index = round_index;
  if (round_index <= up.base_round) {
    throw std::invalid_argument("round " + std::to_string(round_index) + " is not after committed round " +
                                std::to_string(up.base_round));
  }

  std::set<std::string> members;
  if (roster) {
    members = *roster;
  } else {
    for (const auto& kv : up.next.entries) members.insert(kv.first);
  }
  for (const auto& kv : round_scores) members.insert(kv.first);

  const double a = cfg_.alpha;
  for (const std::string& id : members) {
    double s = RewardPolicy::kMinScore;
    const auto it = round_scores.find(id);
    if (it != round_scores.end()) {
      s = sanitize_score(it->second);
    } else {
      up.absent.push_back(id);
    }

    auto [eit, inserted] = up.next.entries.try_emplace(id);
    TrustEntry& e = eit->second;
    if (inserted) e.value = cfg_.initial_trust;
    e.value = (1.0 - a) * e.value + a * s;
    e.last_round = round_index;
  }
  up.next.last_round = round_index;
  return up;
}

void TrustAggregator::commit(const TrustUpdate& update) {
  std::unique_lock lock(store_.mu_);
  if (store_.state_.last_round != update.base_round) {
    throw StaleProposalError("trust proposal for round " + std::to_string(update.round_index) +
                             " was based on round " + std::to_string(update.base_round) +
                             " but the store is at round " + std::to_string(store_.state_.last_round));
  }
  store_.state_ = update.next;
}

TrustSnapshot TrustAggregator::update(const std::map<std::string, ParticipantScore>& round_scores) {
  TrustUpdate up = propose(store_.last_round() + 1, round_scores);
  commit(up);
  return up.snapshot();
}

void save_trust_state(const TrustState& state, const std::string& path) {
  write_text_file(path, json::stringify(trust_state_to_json(state), 2) + "\n");
}

TrustState load_trust_state(const std::string& path) {
  return trust_state_from_json(json::parse(read_text_file(path)));
}

} // namespace aerojudge
