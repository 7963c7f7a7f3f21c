#include "frostcoord/protocol/partial_signature_collector.hpp"

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/protocol/optimistic_retry.hpp"

namespace frostcoord {

PartialSignatureCollector::PartialSignatureCollector(SessionLifecycle& lifecycle) : lifecycle_(lifecycle) {}

PartialSignatureResult PartialSignatureCollector::SubmitPartialSignature(const SessionId& session_id,
                                                                         const ParticipantId& participant_id,
                                                                         const std::string& share_hex) {
  if (share_hex.empty()) {
    throw CoordinatorError(ErrorKind::kValidation, "signature share must not be empty");
  }
  return RetryOnConflict(lifecycle_.config().optimistic_retry_limit, session_id, "partial signature", [&]() {
    return Attempt(session_id, participant_id, share_hex);
  });
}

PartialSignatureResult PartialSignatureCollector::Attempt(const SessionId& session_id,
                                                          const ParticipantId& participant_id,
                                                          const std::string& share_hex) {
  const int64_t now = lifecycle_.Now();
  Session session = lifecycle_.LoadForMutation(session_id, now);
  if (session.status != SessionStatus::kSigning) {
    throw CoordinatorError(ErrorKind::kState,
                           std::string("session is not accepting signature shares (status ") +
                               SessionStatusName(session.status) + ")");
  }
  if (!session.HasParticipant(participant_id)) {
    throw CoordinatorError(ErrorKind::kValidation, "participant is not part of this session");
  }
  const auto commitment = session.nonce_commitments.find(participant_id);
  if (commitment == session.nonce_commitments.end()) {
    throw CoordinatorError(ErrorKind::kSecurity, "participant has no nonce commitment for this session");
  }
  if (session.partial_signatures.count(participant_id) != 0) {
    throw CoordinatorError(ErrorKind::kValidation,
                           "participant already submitted a signature share for this session");
  }

  PartialSignatureResult result;
  lifecycle_.store().RunInTransaction([&]() {
    if (!lifecycle_.store().MarkNonceUsed(session_id, participant_id, commitment->second, now)) {
      Log()->critical("security event: participant {} tried to consume a spent nonce on session {}",
                      participant_id,
                      ShortId(session_id));
      throw CoordinatorError(ErrorKind::kSecurity, "nonce commitment is already used");
    }

    const int64_t read_token = session.updated_at;
    session.partial_signatures[participant_id] = share_hex;
    result.signature_count = static_cast<uint32_t>(session.partial_signatures.size());
    result.threshold_met = result.signature_count >= session.threshold;
    if (result.threshold_met) {
      session.status = SessionStatus::kAggregating;
      result.aggregation_claimed = true;
    }
    lifecycle_.CommitUpdate(session, read_token, now);
  });

  Log()->info("session {}: signature share {}/{} from {}",
              ShortId(session_id),
              result.signature_count,
              session.threshold,
              participant_id);
  if (result.aggregation_claimed) {
    Log()->info("session {} moved to aggregating", ShortId(session_id));
  }
  return result;
}

}  // namespace frostcoord
