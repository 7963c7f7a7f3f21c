#include "frostcoord/protocol/recovery_coordinator.hpp"

#include <set>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"

namespace frostcoord {

RecoveryCoordinator::RecoveryCoordinator(SessionLifecycle& lifecycle, SignatureAggregator& aggregator)
    : lifecycle_(lifecycle), aggregator_(aggregator) {}

RecoveryReport RecoveryCoordinator::RecoverSession(const SessionId& session_id) {
  RecoveryReport report;
  report.session = lifecycle_.GetSession(session_id);
  report.is_expired = report.session.IsExpiredAt(lifecycle_.Now());

  std::set<ParticipantId> committed;
  for (const NonceCommitmentRecord& record : lifecycle_.store().ListNonceCommitments(session_id)) {
    committed.insert(record.participant_id);
  }
  for (const ParticipantId& participant_id : report.session.participants) {
    if (committed.count(participant_id) == 0) {
      report.missing_commitments.push_back(participant_id);
    }
    if (report.session.partial_signatures.count(participant_id) == 0) {
      report.missing_signatures.push_back(participant_id);
    }
  }
  const size_t signed_count = report.session.participants.size() - report.missing_signatures.size();
  report.can_aggregate = signed_count >= report.session.threshold;

  Log()->debug("recovery of session {}: status {}, {} commitments missing, {} shares missing",
               ShortId(session_id),
               SessionStatusName(report.session.status),
               report.missing_commitments.size(),
               report.missing_signatures.size());
  return report;
}

std::optional<SchnorrSignature> RecoveryCoordinator::ResumeSession(const SessionId& session_id) {
  const RecoveryReport report = RecoverSession(session_id);
  if (report.is_expired) {
    throw CoordinatorError(ErrorKind::kExpiration, "session has expired");
  }
  if (!report.can_aggregate) {
    return std::nullopt;
  }

  switch (report.session.status) {
    case SessionStatus::kSigning:
      if (!lifecycle_.TransitionToAggregating(session_id)) {
        return std::nullopt;
      }
      break;
    case SessionStatus::kAggregating:
      break;
    case SessionStatus::kCompleted:
      return report.session.final_signature;
    default:
      throw CoordinatorError(ErrorKind::kState,
                             std::string("cannot resume session in status ") +
                                 SessionStatusName(report.session.status));
  }
  Log()->info("resuming aggregation of session {}", ShortId(session_id));
  return aggregator_.AggregateSignatures(session_id);
}

}  // namespace frostcoord
