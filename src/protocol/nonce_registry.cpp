#include "frostcoord/protocol/nonce_registry.hpp"

#include <stdexcept>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/crypto/encoding.hpp"
#include "frostcoord/protocol/optimistic_retry.hpp"

namespace frostcoord {

NonceRegistry::NonceRegistry(SessionLifecycle& lifecycle) : lifecycle_(lifecycle) {}

NonceSubmissionResult NonceRegistry::SubmitNonceCommitment(const SessionId& session_id,
                                                           const ParticipantId& participant_id,
                                                           const std::string& commitment_hex) {
  std::string commitment;
  try {
    commitment = EncodePointHex(DecodePointHex(commitment_hex));
  } catch (const std::invalid_argument& e) {
    throw CoordinatorError(ErrorKind::kValidation, std::string("invalid nonce commitment: ") + e.what());
  }

  return RetryOnConflict(lifecycle_.config().optimistic_retry_limit, session_id, "nonce commitment", [&]() {
    return Attempt(session_id, participant_id, commitment);
  });
}

NonceSubmissionResult NonceRegistry::Attempt(const SessionId& session_id,
                                             const ParticipantId& participant_id,
                                             const std::string& commitment) {
  const int64_t now = lifecycle_.Now();
  Session session = lifecycle_.LoadForMutation(session_id, now);
  if (session.status != SessionStatus::kPending && session.status != SessionStatus::kNonceCollection) {
    throw CoordinatorError(ErrorKind::kState,
                           std::string("session is not accepting nonce commitments (status ") +
                               SessionStatusName(session.status) + ")");
  }
  if (!session.HasParticipant(participant_id)) {
    throw CoordinatorError(ErrorKind::kValidation, "participant is not part of this session");
  }
  if (session.nonce_commitments.count(participant_id) != 0) {
    throw CoordinatorError(ErrorKind::kValidation,
                           "participant already submitted a nonce commitment for this session");
  }

  NonceSubmissionResult result;
  lifecycle_.store().RunInTransaction([&]() {
    NonceCommitmentRecord record;
    record.session_id = session_id;
    record.participant_id = participant_id;
    record.commitment = commitment;
    record.created_at = now;
    try {
      lifecycle_.store().InsertNonceCommitment(record);
    } catch (const CoordinatorError& e) {
      if (e.kind() == ErrorKind::kSecurity) {
        Log()->critical("security event: nonce reuse attempt by participant {} on session {}",
                        participant_id,
                        ShortId(session_id));
      }
      throw;
    }

    const int64_t read_token = session.updated_at;
    session.nonce_commitments[participant_id] = commitment;
    if (!session.nonce_collection_started_at.has_value()) {
      session.nonce_collection_started_at = now;
    }
    if (session.status == SessionStatus::kPending) {
      session.status = SessionStatus::kNonceCollection;
    }
    result.commitment_count = static_cast<uint32_t>(session.nonce_commitments.size());
    result.threshold_met = result.commitment_count >= session.threshold;
    if (result.threshold_met) {
      session.status = SessionStatus::kSigning;
      if (!session.signing_started_at.has_value()) {
        session.signing_started_at = now;
      }
    }
    lifecycle_.CommitUpdate(session, read_token, now);
  });

  Log()->info("session {}: nonce commitment {}/{} from {}",
              ShortId(session_id),
              result.commitment_count,
              session.threshold,
              participant_id);
  if (result.threshold_met) {
    Log()->info("session {} moved to signing", ShortId(session_id));
  }
  return result;
}

}  // namespace frostcoord
