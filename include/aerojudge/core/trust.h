#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "aerojudge/core/reward.h"

namespace aerojudge {

struct TrustEntry {
  double value{0.5};
  // Last round this participant's value changed. -1 = never.
  std::int64_t last_round{-1};
};

// Plain value form of the trust state (checkpoints, proposals).
struct TrustState {
  std::map<std::string, TrustEntry> entries;
  // Last committed round. -1 = none yet.
  std::int64_t last_round{-1};
};

struct TrustSnapshotEntry {
  std::string id;
  double value{0.0};
  std::int64_t last_round{-1};
};

// Immutable view of the full trust vector, sorted by participant id.
struct TrustSnapshot {
  std::int64_t round_index{-1};
  std::vector<TrustSnapshotEntry> entries;

  // Publication weights (see weighting.h). Empty until attached; may contain
  // a burn participant that has no trust entry.
  std::map<std::string, double> weights;

  const TrustSnapshotEntry* find(const std::string& id) const;
};

TrustSnapshot snapshot_of(const TrustState& state);

// Owned, lock-protected trust store.
//
// Readers (snapshots, proposals) take a shared lock; the only writer is
// TrustAggregator::commit(), which takes the exclusive lock once per round.
class TrustStore {
 public:
  TrustStore() = default;
  explicit TrustStore(TrustState initial) : state_(std::move(initial)) {}

  TrustStore(const TrustStore&) = delete;
  TrustStore& operator=(const TrustStore&) = delete;

  TrustState state() const;
  TrustSnapshot snapshot() const;
  std::int64_t last_round() const;
  std::size_t size() const;
  bool contains(const std::string& id) const;

  // Replaces the whole state (restore from a checkpoint).
  void restore(TrustState state);

 private:
  friend class TrustAggregator;

  mutable std::shared_mutex mu_;
  TrustState state_;
};

struct TrustConfig {
  // EMA smoothing factor, in (0, 1].
  double alpha{0.2};

  // Value assigned to a participant the first time it is seen.
  double initial_trust{0.5};
};

// Checks alpha and initial_trust. Empty => valid.
std::vector<std::string> validate_trust_config(const TrustConfig& cfg);

// An uncommitted trust update computed from a fixed base state.
struct TrustUpdate {
  std::int64_t base_round{-1};
  std::int64_t round_index{0};

  // Complete state after the update.
  TrustState next;

  // Roster members that had no score and were charged the minimum.
  std::vector<std::string> absent;

  TrustSnapshot snapshot() const { return snapshot_of(next); }
};

// Thrown by commit() when the store moved on since the proposal was made.
class StaleProposalError : public std::runtime_error {
 public:
  explicit StaleProposalError(const std::string& msg) : std::runtime_error(msg) {}
};

// Exponential moving average over per-round scores:
//
//   trust' = (1 - alpha) * trust + alpha * score
//
// Absent roster members are charged RewardPolicy::kMinScore, so silence never
// beats a bad answer. Participants outside the roster keep their value.
class TrustAggregator {
 public:
  explicit TrustAggregator(TrustStore& store, TrustConfig cfg = {});

  // Pure: reads the store under a shared lock and computes the next state.
  //
  // roster == nullptr means every known participant plus every scored one.
  // Scored ids are always updated, whether or not they are in the roster.
  // Throws std::invalid_argument if round_index is not after the store's
  // last committed round.
  TrustUpdate propose(std::int64_t round_index, const std::map<std::string, ParticipantScore>& round_scores,
                      const std::set<std::string>* roster = nullptr) const;

  // Applies a proposal under the exclusive lock. Throws StaleProposalError if
  // the store's last round no longer matches the proposal's base.
  void commit(const TrustUpdate& update);

  // propose() + commit() for the next round index in one call.
  TrustSnapshot update(const std::map<std::string, ParticipantScore>& round_scores);

  const TrustConfig& config() const { return cfg_; }
  TrustStore& store() { return store_; }

 private:
  TrustStore& store_;
  TrustConfig cfg_;
};

// Checkpoint I/O. The file is JSON: {"last_round": N, "participants":
// {id: {"trust": v, "last_round": r}}}. The loader also accepts a bare
// id -> {trust, last_round} mapping. Both throw std::runtime_error on failure.
void save_trust_state(const TrustState& state, const std::string& path);
TrustState load_trust_state(const std::string& path);

} // namespace aerojudge
