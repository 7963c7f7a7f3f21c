#include "frostcoord/protocol/signature_aggregator.hpp"

#include <optional>
#include <stdexcept>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/crypto/encoding.hpp"
#include "frostcoord/protocol/optimistic_retry.hpp"

namespace frostcoord {

SignatureAggregator::SignatureAggregator(SessionLifecycle& lifecycle, std::shared_ptr<GroupKeyDirectory> group_keys)
    : lifecycle_(lifecycle), group_keys_(std::move(group_keys)) {
  if (!group_keys_) {
    throw std::invalid_argument("SignatureAggregator requires a group key directory");
  }
}

SchnorrSignature SignatureAggregator::Combine(const Session& session) const {
  Scalar s;
  std::optional<ECPoint> R;
  for (const ParticipantId& participant_id : session.participants) {
    const auto share_it = session.partial_signatures.find(participant_id);
    if (share_it == session.partial_signatures.end()) {
      continue;
    }

    Scalar share;
    try {
      share = DecodeNonZeroScalarHex(share_it->second);
    } catch (const std::invalid_argument& e) {
      throw CoordinatorError(ErrorKind::kAggregation,
                             "invalid signature share from " + participant_id + ": " + e.what());
    }

    const auto commitment_it = session.nonce_commitments.find(participant_id);
    if (commitment_it == session.nonce_commitments.end()) {
      throw CoordinatorError(ErrorKind::kAggregation, "missing nonce commitment for " + participant_id);
    }
    ECPoint commitment;
    try {
      commitment = DecodePointHex(commitment_it->second);
    } catch (const std::invalid_argument& e) {
      throw CoordinatorError(ErrorKind::kAggregation,
                             "invalid nonce commitment from " + participant_id + ": " + e.what());
    }

    s = s + share;
    try {
      R = R.has_value() ? R->Add(commitment) : commitment;
    } catch (const std::invalid_argument& e) {
      throw CoordinatorError(ErrorKind::kAggregation, std::string("nonce commitments do not combine: ") + e.what());
    }
  }

  if (!R.has_value()) {
    throw CoordinatorError(ErrorKind::kAggregation, "no signature shares to aggregate");
  }
  return SchnorrSignature{*R, s};
}

SchnorrSignature SignatureAggregator::AggregateSignatures(const SessionId& session_id) {
  return RetryOnConflict(lifecycle_.config().optimistic_retry_limit, session_id, "aggregation", [&]() {
    const int64_t now = lifecycle_.Now();
    Session session = lifecycle_.LoadForMutation(session_id, now);
    if (session.status != SessionStatus::kAggregating) {
      throw CoordinatorError(ErrorKind::kState,
                             std::string("session is not aggregating (status ") +
                                 SessionStatusName(session.status) + ")");
    }
    if (session.partial_signatures.size() < session.threshold) {
      throw CoordinatorError(ErrorKind::kAggregation,
                             "insufficient signature shares: have " +
                                 std::to_string(session.partial_signatures.size()) + ", need " +
                                 std::to_string(session.threshold));
    }

    SchnorrSignature signature;
    try {
      signature = Combine(session);
    } catch (const CoordinatorError& e) {
      Log()->error("aggregation of session {} failed: {}", ShortId(session_id), e.what());
      throw;
    }

    const int64_t read_token = session.updated_at;
    session.final_signature = signature;
    session.status = SessionStatus::kCompleted;
    session.completed_at = now;
    lifecycle_.CommitUpdate(session, read_token, now);
    Log()->info("session {} completed with {} shares", ShortId(session_id), session.partial_signatures.size());
    return signature;
  });
}

bool SignatureAggregator::VerifyAggregatedSignature(const SessionId& session_id, const Bytes& message_hash) {
  if (message_hash.size() != kMessageHashLen) {
    throw CoordinatorError(ErrorKind::kValidation, "message hash must be exactly 32 bytes");
  }
  const Session session = lifecycle_.GetSession(session_id);
  if (session.status != SessionStatus::kCompleted || !session.final_signature.has_value()) {
    throw CoordinatorError(ErrorKind::kState,
                           std::string("session has no final signature (status ") +
                               SessionStatusName(session.status) + ")");
  }
  const auto group_public_key = group_keys_->FindGroupPublicKey(session.group_id);
  if (!group_public_key.has_value()) {
    throw CoordinatorError(ErrorKind::kNotFound, "no group public key for group " + session.group_id);
  }
  const bool valid = VerifySchnorr(*group_public_key, message_hash, *session.final_signature);
  if (!valid) {
    Log()->warn("aggregated signature of session {} failed verification", ShortId(session_id));
  }
  return valid;
}

}  // namespace frostcoord
