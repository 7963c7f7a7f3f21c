#include "frostcoord/protocol/approval_gate.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/crypto/random.hpp"

namespace frostcoord {

ApprovalGate::ApprovalGate(SessionLifecycle& lifecycle,
                           std::shared_ptr<PermissionService> permissions,
                           std::shared_ptr<ApprovalAuditService> audit)
    : lifecycle_(lifecycle), permissions_(std::move(permissions)), audit_(std::move(audit)) {
  if (!permissions_) {
    throw std::invalid_argument("ApprovalGate requires a permission service");
  }
  if (!audit_) {
    throw std::invalid_argument("ApprovalGate requires an approval audit service");
  }
}

GateOutcome ApprovalGate::RequestSession(const CreateSessionRequest& request,
                                         const ParticipantId& requester_id,
                                         const std::string& event_type) {
  SessionLifecycle::ValidateCreateRequest(request);

  GateOutcome outcome;
  const PermissionDecision decision = permissions_->CanSign(request.group_id, requester_id, event_type);
  if (!decision.allowed) {
    outcome.decision = GateDecision::kDenied;
    outcome.reason = decision.reason.empty() ? "requester may not sign this event type" : decision.reason;
    Log()->warn("denied signing request by {} for {}: {}", requester_id, event_type, outcome.reason);
    return outcome;
  }

  CreateSessionRequest stored = request;
  stored.created_by = requester_id;
  stored.event_type = event_type;

  if (!decision.requires_approval) {
    outcome.decision = GateDecision::kCreated;
    outcome.session = lifecycle_.CreateSession(stored);
    outcome.reason = decision.reason;
    return outcome;
  }

  const int64_t now = lifecycle_.Now();
  ApprovalRequest approval;
  approval.id = Csprng::RandomSessionId();
  approval.request = stored;
  approval.requester_id = requester_id;
  approval.event_type = event_type;
  approval.permission_id = decision.permission_id;
  approval.approval_threshold = std::max<uint32_t>(decision.approval_threshold, 1);
  approval.created_at = now;
  approval.updated_at = now;
  audit_->RecordRequest(approval);

  outcome.decision = GateDecision::kPendingApproval;
  outcome.approval_id = approval.id;
  outcome.approval_threshold = approval.approval_threshold;
  outcome.reason = decision.reason;
  Log()->info("signing request {} by {} awaits {} approvals",
              ShortId(approval.id),
              requester_id,
              approval.approval_threshold);
  return outcome;
}

ApprovalRequest ApprovalGate::LoadPending(const std::string& approval_id) {
  auto approval = audit_->FindRequest(approval_id);
  if (!approval.has_value()) {
    throw CoordinatorError(ErrorKind::kNotFound, "approval request not found: " + approval_id);
  }
  if (approval->status != ApprovalStatus::kPending) {
    throw CoordinatorError(ErrorKind::kState,
                           std::string("approval request is already ") + ApprovalStatusName(approval->status));
  }
  return std::move(*approval);
}

void ApprovalGate::RequireAuthority(const ApprovalRequest& approval, const std::string& role, const char* action) {
  if (!approval.permission_id.has_value()) {
    throw CoordinatorError(ErrorKind::kSecurity, "approval request has no permission to check authority against");
  }
  std::vector<std::string> roles;
  try {
    roles = permissions_->ApproverRoles(*approval.permission_id);
  } catch (const std::exception& e) {
    Log()->error("permission lookup for {} failed, denying {}: {}", *approval.permission_id, action, e.what());
    throw CoordinatorError(ErrorKind::kSecurity,
                           "permission configuration not found, cannot verify approval authority");
  }
  if (std::find(roles.begin(), roles.end(), role) == roles.end()) {
    throw CoordinatorError(ErrorKind::kSecurity, "role '" + role + "' is not authorized to " + action +
                                                     " this event type");
  }
}

GateOutcome ApprovalGate::Approve(const std::string& approval_id,
                                  const ParticipantId& approver_id,
                                  const std::string& approver_role) {
  const ApprovalRequest approval = LoadPending(approval_id);
  RequireAuthority(approval, approver_role, "approve");

  const int64_t now = lifecycle_.Now();
  const uint32_t approvals = audit_->AddVote(approval_id, ApprovalVote{approver_id, approver_role, now});

  GateOutcome outcome;
  outcome.approval_id = approval_id;
  outcome.approvals = approvals;
  outcome.approval_threshold = approval.approval_threshold;
  if (approvals < approval.approval_threshold) {
    outcome.decision = GateDecision::kPendingApproval;
    outcome.reason = "Approval " + std::to_string(approvals) + "/" + std::to_string(approval.approval_threshold);
    return outcome;
  }

  // The session exists before the request leaves pending, so a failed create
  // leaves the approval open for a retry.
  Session session = lifecycle_.CreateSession(approval.request);
  if (!audit_->ResolvePending(approval_id, ApprovalStatus::kApproved, std::nullopt, std::nullopt, now)) {
    try {
      (void)lifecycle_.FailSession(session.id, "approval request was resolved concurrently");
    } catch (const CoordinatorError& e) {
      Log()->warn("could not fail orphaned session {}: {}", ShortId(session.id), e.what());
    }
    throw CoordinatorError(ErrorKind::kState, "approval request was resolved concurrently");
  }
  audit_->AttachSession(approval_id, session.id, now);
  Log()->info("signing request {} approved, session {} created", ShortId(approval_id), ShortId(session.id));

  outcome.decision = GateDecision::kCreated;
  outcome.session = std::move(session);
  outcome.reason = "approval threshold met";
  return outcome;
}

void ApprovalGate::Reject(const std::string& approval_id,
                          const ParticipantId& rejecter_id,
                          const std::string& rejecter_role,
                          const std::string& reason) {
  const ApprovalRequest approval = LoadPending(approval_id);
  RequireAuthority(approval, rejecter_role, "reject");
  if (!audit_->ResolvePending(approval_id, ApprovalStatus::kRejected, rejecter_id, reason, lifecycle_.Now())) {
    throw CoordinatorError(ErrorKind::kState, "approval request was resolved concurrently");
  }
  Log()->info("signing request {} rejected by {}: {}", ShortId(approval_id), rejecter_id, reason);
}

std::vector<ApprovalRequest> ApprovalGate::ListPendingApprovals(const GroupId& group_id) {
  return audit_->ListPending(group_id);
}

}  // namespace frostcoord
