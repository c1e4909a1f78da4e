#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "aerojudge/core/trust.h"
#include "aerojudge/util/file_io.h"

#define AJ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace aerojudge;

TrustState seeded_state(const std::map<std::string, double>& values, std::int64_t round) {
  TrustState s;
  s.last_round = round;
  for (const auto& [id, v] : values) s.entries[id] = TrustEntry{v, round};
  return s;
}

bool same_state(const TrustState& a, const TrustState& b) {
  if (a.last_round != b.last_round || a.entries.size() != b.entries.size()) return false;
  for (const auto& [id, e] : a.entries) {
    const auto it = b.entries.find(id);
    if (it == b.entries.end()) return false;
    if (it->second.value != e.value || it->second.last_round != e.last_round) return false;
  }
  return true;
}

} // namespace

int test_trust() {
  // Absence is charged exactly like a minimum-score result.
  {
    TrustStore store(seeded_state({{"alice", 0.6}, {"bob", 0.6}, {"carol", 0.6}}, 0));
    TrustAggregator agg(store);
    const std::set<std::string> roster{"alice", "bob", "carol"};
    const TrustUpdate up = agg.propose(1, {{"alice", RewardPolicy::kMinScore}, {"carol", 0.9}}, &roster);
    AJ_ASSERT(up.absent.size() == 1 && up.absent[0] == "bob");
    AJ_ASSERT(up.next.entries.at("alice").value == up.next.entries.at("bob").value);
    AJ_ASSERT(std::fabs(up.next.entries.at("bob").value - 0.48) < 1e-12);
    AJ_ASSERT(std::fabs(up.next.entries.at("carol").value - 0.66) < 1e-12);
    AJ_ASSERT(up.next.entries.at("bob").last_round == 1);

    // propose() is pure: the store has not moved.
    AJ_ASSERT(store.last_round() == 0);
    AJ_ASSERT(store.state().entries.at("bob").value == 0.6);
  }

  // Participants outside the roster keep their value and round.
  {
    TrustStore store(seeded_state({{"alice", 0.6}, {"dave", 0.7}}, 3));
    TrustAggregator agg(store);
    const std::set<std::string> roster{"alice"};
    const TrustUpdate up = agg.propose(4, {{"alice", 1.0}}, &roster);
    AJ_ASSERT(up.absent.empty());
    AJ_ASSERT(up.next.entries.at("dave").value == 0.7);
    AJ_ASSERT(up.next.entries.at("dave").last_round == 3);
    AJ_ASSERT(up.next.last_round == 4);

    // Without a roster every known participant is expected.
    const TrustUpdate all = agg.propose(4, {{"alice", 1.0}});
    AJ_ASSERT(all.absent.size() == 1 && all.absent[0] == "dave");
  }

  // Newcomers start at the initial value; scores are sanitised into range.
  {
    TrustStore store;
    TrustAggregator agg(store);
    const TrustSnapshot snap =
        agg.update({{"new", 1.0}, {"huge", 7.0}, {"nan", std::nan("")}, {"negative", -3.0}});
    AJ_ASSERT(snap.round_index == 0);
    AJ_ASSERT(std::fabs(snap.find("new")->value - 0.6) < 1e-12);
    AJ_ASSERT(snap.find("huge")->value == snap.find("new")->value);
    AJ_ASSERT(std::fabs(snap.find("nan")->value - 0.4) < 1e-12);
    AJ_ASSERT(snap.find("negative")->value == snap.find("nan")->value);
    AJ_ASSERT(snap.find("nobody") == nullptr);
    AJ_ASSERT(store.size() == 4);
    AJ_ASSERT(store.contains("huge"));

    // Snapshots are sorted by id.
    for (std::size_t i = 1; i < snap.entries.size(); ++i) AJ_ASSERT(snap.entries[i - 1].id < snap.entries[i].id);
  }

  // Constant scores: trust moves monotonically toward the score and never overshoots.
  {
    const double starts[] = {0.95, 0.05};
    const double targets[] = {0.3, 0.8};
    for (int c = 0; c < 2; ++c) {
      TrustStore store(seeded_state({{"p", starts[c]}}, 0));
      TrustAggregator agg(store, TrustConfig{0.35, 0.5});
      double prev = starts[c];
      const double s = targets[c];
      for (int k = 0; k < 60; ++k) {
        const double v = agg.update({{"p", s}}).find("p")->value;
        AJ_ASSERT(std::fabs(v - s) <= std::fabs(prev - s));
        if (starts[c] > s) {
          AJ_ASSERT(v <= prev && v >= s);
        } else {
          AJ_ASSERT(v >= prev && v <= s);
        }
        prev = v;
      }
      AJ_ASSERT(std::fabs(prev - s) < 1e-6);
    }
  }

  // Rounds must move forward.
  {
    TrustStore store(seeded_state({{"a", 0.5}}, 5));
    const TrustAggregator agg(store);
    bool threw = false;
    try {
      (void)agg.propose(5, {{"a", 1.0}});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AJ_ASSERT(threw);
  }

  // A proposal computed from a stale base is refused at commit.
  {
    TrustStore store(seeded_state({{"a", 0.5}}, 0));
    TrustAggregator agg(store);
    const TrustUpdate first = agg.propose(1, {{"a", 1.0}});
    const TrustUpdate second = agg.propose(1, {{"a", 0.0}});
    agg.commit(first);
    const TrustState after_first = store.state();
    bool threw = false;
    try {
      agg.commit(second);
    } catch (const StaleProposalError&) {
      threw = true;
    }
    AJ_ASSERT(threw);
    AJ_ASSERT(same_state(store.state(), after_first));
  }

  // Bad configuration is refused up front.
  {
    AJ_ASSERT(validate_trust_config(TrustConfig{}).empty());
    AJ_ASSERT(!validate_trust_config(TrustConfig{0.0, 0.5}).empty());
    AJ_ASSERT(!validate_trust_config(TrustConfig{1.5, 0.5}).empty());
    AJ_ASSERT(!validate_trust_config(TrustConfig{std::nan(""), 0.5}).empty());
    AJ_ASSERT(!validate_trust_config(TrustConfig{0.2, 2.0}).empty());
    AJ_ASSERT(validate_trust_config(TrustConfig{1.0, 0.0}).empty());

    TrustStore store;
    bool threw = false;
    try {
      TrustAggregator agg(store, TrustConfig{-0.1, 0.5});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AJ_ASSERT(threw);
  }

  // Restarting from a checkpoint mid-sequence reproduces the uninterrupted
  // trajectory exactly.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "aerojudge_test_trust";
    dir /= std::to_string(static_cast<long long>(nonce));
    const std::string path = (dir / "trust.json").string();

    const std::vector<std::map<std::string, double>> rounds = {
        {{"a", 0.9}, {"b", 0.1}},
        {{"a", 0.7}, {"c", 0.55}},
        {{"b", 1.0 / 3.0}, {"c", 0.05}},
        {{"a", 0.0}, {"b", 0.6}, {"c", 0.61}},
        {{"d", 0.99}},
        {{"a", 0.123456789}, {"d", 0.5}},
    };

    TrustStore straight;
    TrustAggregator straight_agg(straight);
    for (const auto& r : rounds) straight_agg.update(r);

    {
      TrustStore first_half;
      TrustAggregator agg(first_half);
      for (std::size_t i = 0; i < 3; ++i) agg.update(rounds[i]);
      save_trust_state(first_half.state(), path);
    }
    {
      TrustStore resumed(load_trust_state(path));
      AJ_ASSERT(resumed.last_round() == 2);
      TrustAggregator agg(resumed);
      for (std::size_t i = 3; i < rounds.size(); ++i) agg.update(rounds[i]);
      AJ_ASSERT(same_state(resumed.state(), straight.state()));
    }

    // The loader also accepts a bare id -> entry mapping.
    write_text_file(path, "{\"x\": {\"trust\": 0.25, \"last_round\": 7}, \"y\": {\"trust\": 0.5, \"last_round\": 2}}");
    const TrustState bare = load_trust_state(path);
    AJ_ASSERT(bare.last_round == 7);
    AJ_ASSERT(bare.entries.at("x").value == 0.25);

    // Corrupt checkpoints are reported, never half-loaded.
    write_text_file(path, "{\"participants\": {\"x\": {\"trust\": \"high\"}}}");
    bool threw = false;
    try {
      (void)load_trust_state(path);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AJ_ASSERT(threw);

    // Out-of-range trust values and round numbers are refused as well.
    const char* corrupt[] = {
        "{\"last_round\": 1e300, \"participants\": {\"p\": {\"trust\": 7.5, \"last_round\": 1e300}}}",
        "{\"last_round\": 3, \"participants\": {\"p\": {\"trust\": 7.5, \"last_round\": 3}}}",
        "{\"last_round\": 3, \"participants\": {\"p\": {\"trust\": -0.25, \"last_round\": 3}}}",
        "{\"last_round\": 1e300, \"participants\": {\"p\": {\"trust\": 0.5, \"last_round\": 3}}}",
        "{\"last_round\": 3, \"participants\": {\"p\": {\"trust\": 0.5, \"last_round\": 2.5}}}",
        "{\"last_round\": -2, \"participants\": {}}",
        "{\"last_round\": 1, \"participants\": {\"p\": {\"trust\": 0.5, \"last_round\": 4}}}",
        "{\"p\": {\"trust\": 0.5, \"last_round\": -9e18}}",
    };
    for (const char* text : corrupt) {
      write_text_file(path, text);
      bool rejected = false;
      try {
        (void)load_trust_state(path);
      } catch (const std::runtime_error&) {
        rejected = true;
      }
      AJ_ASSERT(rejected);
    }

    // The score range bounds themselves are fine.
    write_text_file(path, "{\"last_round\": 9, \"participants\": {\"lo\": {\"trust\": 0, \"last_round\": 9}, "
                          "\"hi\": {\"trust\": 1, \"last_round\": -1}}}");
    const TrustState edges = load_trust_state(path);
    AJ_ASSERT(edges.last_round == 9);
    AJ_ASSERT(edges.entries.at("lo").value == RewardPolicy::kMinScore);
    AJ_ASSERT(edges.entries.at("hi").value == RewardPolicy::kMaxScore);

    fs::remove_all(dir, ec);
  }

  // restore() swaps the whole state.
  {
    TrustStore store;
    store.restore(seeded_state({{"z", 0.3}}, 9));
    AJ_ASSERT(store.last_round() == 9);
    AJ_ASSERT(store.snapshot().find("z")->value == 0.3);
  }

  return 0;
}
