#pragma once

#include <optional>
#include <vector>

#include "frostcoord/protocol/session_lifecycle.hpp"
#include "frostcoord/protocol/signature_aggregator.hpp"

namespace frostcoord {

struct RecoveryReport {
  Session session;
  std::vector<ParticipantId> missing_commitments;
  std::vector<ParticipantId> missing_signatures;
  // Share count meets threshold, even if status has not caught up.
  bool can_aggregate = false;
  bool is_expired = false;
};

class RecoveryCoordinator {
 public:
  RecoveryCoordinator(SessionLifecycle& lifecycle, SignatureAggregator& aggregator);

  // Read-only diagnosis from persisted state.
  RecoveryReport RecoverSession(const SessionId& session_id);

  // Finishes a session whose shares are all in: claims aggregation if the
  // status lags in signing, then aggregates. Returns nullopt when shares are
  // still missing or another caller holds the aggregation claim.
  std::optional<SchnorrSignature> ResumeSession(const SessionId& session_id);

 private:
  SessionLifecycle& lifecycle_;
  SignatureAggregator& aggregator_;
};

}  // namespace frostcoord
