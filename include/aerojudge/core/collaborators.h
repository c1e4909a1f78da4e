#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "aerojudge/core/challenge.h"
#include "aerojudge/core/flight_plan.h"
#include "aerojudge/core/trust.h"

namespace aerojudge {

// Transport-specific correlation token for one dispatched challenge.
struct DispatchHandle {
  std::string participant_id;
  std::uint64_t challenge_id{0};
  // Opaque to the core.
  std::uint64_t token{0};
};

// Unreliable fan-out / fan-in to participants.
//
// The core does not care about transport, wire format or authentication;
// only that challenge ids survive the round trip.
class DispatchChannel {
 public:
  virtual ~DispatchChannel() = default;

  virtual std::vector<DispatchHandle> broadcast(const ChallengeSpec& challenge,
                                                const std::set<std::string>& participant_ids) = 0;

  // Blocks until every handle answered or `deadline` passed. A missing key or
  // std::nullopt both mean "no response". Implementations must not return
  // responses that arrived after the deadline.
  virtual std::map<std::string, std::optional<FlightPlan>> collect(
      const std::vector<DispatchHandle>& handles, std::chrono::steady_clock::time_point deadline) = 0;
};

// Identity registry and weight publication.
class LedgerClient {
 public:
  virtual ~LedgerClient() = default;

  // false (or an exception) means the trust vector was not published.
  virtual bool publish(const TrustSnapshot& snapshot) = 0;

  virtual std::set<std::string> current_participant_ids() = 0;
};

} // namespace aerojudge
