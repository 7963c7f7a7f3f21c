#pragma once

#include <cstdint>
#include <string>

#include "frostcoord/protocol/session_lifecycle.hpp"

namespace frostcoord {

struct NonceSubmissionResult {
  uint32_t commitment_count = 0;
  bool threshold_met = false;
};

// Round 1. Commitments land in the append-only ledger, whose uniqueness on
// the commitment value rejects any nonce seen before, in any session.
class NonceRegistry {
 public:
  explicit NonceRegistry(SessionLifecycle& lifecycle);

  // `commitment_hex` is a SEC1 point (66 or 130 hex chars). It is stored in
  // compressed form so both encodings of one point collide in the ledger.
  NonceSubmissionResult SubmitNonceCommitment(const SessionId& session_id,
                                              const ParticipantId& participant_id,
                                              const std::string& commitment_hex);

 private:
  NonceSubmissionResult Attempt(const SessionId& session_id,
                                const ParticipantId& participant_id,
                                const std::string& commitment);

  SessionLifecycle& lifecycle_;
};

}  // namespace frostcoord
