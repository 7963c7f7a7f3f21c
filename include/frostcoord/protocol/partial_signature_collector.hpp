#pragma once

#include <cstdint>
#include <string>

#include "frostcoord/protocol/session_lifecycle.hpp"

namespace frostcoord {

struct PartialSignatureResult {
  uint32_t signature_count = 0;
  bool threshold_met = false;
  // True only for the submission whose write moved the session to
  // aggregating; that caller owns running the aggregator.
  bool aggregation_claimed = false;
};

// Round 2. Consumes the participant's ledger row before accepting a share.
class PartialSignatureCollector {
 public:
  explicit PartialSignatureCollector(SessionLifecycle& lifecycle);

  PartialSignatureResult SubmitPartialSignature(const SessionId& session_id,
                                                const ParticipantId& participant_id,
                                                const std::string& share_hex);

 private:
  PartialSignatureResult Attempt(const SessionId& session_id,
                                 const ParticipantId& participant_id,
                                 const std::string& share_hex);

  SessionLifecycle& lifecycle_;
};

}  // namespace frostcoord
