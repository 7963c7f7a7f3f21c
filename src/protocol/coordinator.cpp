#include "frostcoord/protocol/coordinator.hpp"

#include <stdexcept>

#include "frostcoord/common/logging.hpp"

namespace frostcoord {

FrostCoordinator::FrostCoordinator(CoordinatorDependencies deps, CoordinatorConfig config)
    : deps_(std::move(deps)),
      lifecycle_(deps_.store, config, deps_.clock),
      nonces_(lifecycle_),
      shares_(lifecycle_),
      aggregator_(lifecycle_, deps_.group_keys),
      recovery_(lifecycle_, aggregator_) {
  SetLogLevel(config.log_level);
  if (deps_.permissions && deps_.approvals) {
    gate_ = std::make_unique<ApprovalGate>(lifecycle_, deps_.permissions, deps_.approvals);
  }
  if (deps_.publication) {
    publisher_ = std::make_unique<CompletionPublisher>(lifecycle_, deps_.group_keys, deps_.publication,
                                                       deps_.notifier);
  }
}

ApprovalGate& FrostCoordinator::gate() {
  if (!gate_) {
    throw std::logic_error("approval gate needs a permission service and an approval audit service");
  }
  return *gate_;
}

CompletionPublisher& FrostCoordinator::publisher() {
  if (!publisher_) {
    throw std::logic_error("publication needs a publication adapter");
  }
  return *publisher_;
}

Session FrostCoordinator::CreateSession(const CreateSessionRequest& request) {
  return lifecycle_.CreateSession(request);
}

Session FrostCoordinator::GetSession(const SessionId& session_id) {
  return lifecycle_.GetSession(session_id);
}

Session FrostCoordinator::FailSession(const SessionId& session_id, const std::string& reason) {
  Session failed = lifecycle_.FailSession(session_id, reason);
  DeliverNotice(deps_.notifier,
                CompletionNotice{failed.id, SessionStatus::kFailed, std::nullopt, failed.participants});
  return failed;
}

size_t FrostCoordinator::ExpireStaleSessions() {
  return lifecycle_.ExpireStaleSessions();
}

size_t FrostCoordinator::CleanupOldSessions() {
  return lifecycle_.CleanupOldSessions();
}

size_t FrostCoordinator::CleanupOldSessions(uint32_t retention_days) {
  return lifecycle_.CleanupOldSessions(retention_days);
}

bool FrostCoordinator::TransitionToAggregating(const SessionId& session_id) {
  return lifecycle_.TransitionToAggregating(session_id);
}

std::vector<Session> FrostCoordinator::ListActiveSessions(const GroupId& group_id) {
  return lifecycle_.ListActiveSessions(group_id);
}

std::vector<Session> FrostCoordinator::ListPendingSessionsFor(const ParticipantId& participant_id) {
  return lifecycle_.ListPendingSessionsFor(participant_id);
}

NonceSubmissionResult FrostCoordinator::SubmitNonceCommitment(const SessionId& session_id,
                                                              const ParticipantId& participant_id,
                                                              const std::string& commitment_hex) {
  return nonces_.SubmitNonceCommitment(session_id, participant_id, commitment_hex);
}

PartialSignatureResult FrostCoordinator::SubmitPartialSignature(const SessionId& session_id,
                                                                const ParticipantId& participant_id,
                                                                const std::string& share_hex) {
  return shares_.SubmitPartialSignature(session_id, participant_id, share_hex);
}

SchnorrSignature FrostCoordinator::AggregateSignatures(const SessionId& session_id) {
  return aggregator_.AggregateSignatures(session_id);
}

bool FrostCoordinator::VerifyAggregatedSignature(const SessionId& session_id, const Bytes& message_hash) {
  return aggregator_.VerifyAggregatedSignature(session_id, message_hash);
}

GateOutcome FrostCoordinator::RequestSession(const CreateSessionRequest& request,
                                             const ParticipantId& requester_id,
                                             const std::string& event_type) {
  return gate().RequestSession(request, requester_id, event_type);
}

GateOutcome FrostCoordinator::Approve(const std::string& approval_id,
                                      const ParticipantId& approver_id,
                                      const std::string& approver_role) {
  return gate().Approve(approval_id, approver_id, approver_role);
}

void FrostCoordinator::Reject(const std::string& approval_id,
                              const ParticipantId& rejecter_id,
                              const std::string& rejecter_role,
                              const std::string& reason) {
  gate().Reject(approval_id, rejecter_id, rejecter_role, reason);
}

std::vector<ApprovalRequest> FrostCoordinator::ListPendingApprovals(const GroupId& group_id) {
  return gate().ListPendingApprovals(group_id);
}

RecoveryReport FrostCoordinator::RecoverSession(const SessionId& session_id) {
  return recovery_.RecoverSession(session_id);
}

std::optional<SchnorrSignature> FrostCoordinator::ResumeSession(const SessionId& session_id) {
  return recovery_.ResumeSession(session_id);
}

std::string FrostCoordinator::PublishCompletedSession(const SessionId& session_id) {
  return publisher().PublishCompletedSession(session_id);
}

}  // namespace frostcoord
