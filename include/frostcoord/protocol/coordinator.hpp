#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "frostcoord/common/config.hpp"
#include "frostcoord/net/publication.hpp"
#include "frostcoord/protocol/approval_gate.hpp"
#include "frostcoord/protocol/completion_publisher.hpp"
#include "frostcoord/protocol/nonce_registry.hpp"
#include "frostcoord/protocol/partial_signature_collector.hpp"
#include "frostcoord/protocol/recovery_coordinator.hpp"
#include "frostcoord/protocol/session_lifecycle.hpp"
#include "frostcoord/protocol/signature_aggregator.hpp"
#include "frostcoord/store/group_key_directory.hpp"
#include "frostcoord/store/session_store.hpp"

namespace frostcoord {

struct CoordinatorDependencies {
  std::shared_ptr<SessionStore> store;
  std::shared_ptr<GroupKeyDirectory> group_keys;
  // The approval gate needs both of these.
  std::shared_ptr<PermissionService> permissions;
  std::shared_ptr<ApprovalAuditService> approvals;
  // Publication needs the adapter; the notifier is optional.
  std::shared_ptr<IPublicationAdapter> publication;
  std::shared_ptr<INotifier> notifier;
  // Defaults to the system clock.
  Clock clock;
};

// One entry point per operation, all sharing a store, clock and config.
class FrostCoordinator {
 public:
  FrostCoordinator(CoordinatorDependencies deps, CoordinatorConfig config);

  FrostCoordinator(const FrostCoordinator&) = delete;
  FrostCoordinator& operator=(const FrostCoordinator&) = delete;

  Session CreateSession(const CreateSessionRequest& request);
  Session GetSession(const SessionId& session_id);
  Session FailSession(const SessionId& session_id, const std::string& reason);
  size_t ExpireStaleSessions();
  size_t CleanupOldSessions();
  size_t CleanupOldSessions(uint32_t retention_days);
  bool TransitionToAggregating(const SessionId& session_id);
  std::vector<Session> ListActiveSessions(const GroupId& group_id);
  std::vector<Session> ListPendingSessionsFor(const ParticipantId& participant_id);

  NonceSubmissionResult SubmitNonceCommitment(const SessionId& session_id,
                                              const ParticipantId& participant_id,
                                              const std::string& commitment_hex);
  PartialSignatureResult SubmitPartialSignature(const SessionId& session_id,
                                                const ParticipantId& participant_id,
                                                const std::string& share_hex);

  SchnorrSignature AggregateSignatures(const SessionId& session_id);
  bool VerifyAggregatedSignature(const SessionId& session_id, const Bytes& message_hash);

  GateOutcome RequestSession(const CreateSessionRequest& request,
                             const ParticipantId& requester_id,
                             const std::string& event_type);
  GateOutcome Approve(const std::string& approval_id,
                      const ParticipantId& approver_id,
                      const std::string& approver_role);
  void Reject(const std::string& approval_id,
              const ParticipantId& rejecter_id,
              const std::string& rejecter_role,
              const std::string& reason);
  std::vector<ApprovalRequest> ListPendingApprovals(const GroupId& group_id);

  RecoveryReport RecoverSession(const SessionId& session_id);
  std::optional<SchnorrSignature> ResumeSession(const SessionId& session_id);

  std::string PublishCompletedSession(const SessionId& session_id);

 private:
  ApprovalGate& gate();
  CompletionPublisher& publisher();

  CoordinatorDependencies deps_;
  SessionLifecycle lifecycle_;
  NonceRegistry nonces_;
  PartialSignatureCollector shares_;
  SignatureAggregator aggregator_;
  RecoveryCoordinator recovery_;
  std::unique_ptr<ApprovalGate> gate_;
  std::unique_ptr<CompletionPublisher> publisher_;
};

}  // namespace frostcoord
