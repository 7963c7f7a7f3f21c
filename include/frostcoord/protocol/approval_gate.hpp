#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "frostcoord/protocol/session_lifecycle.hpp"
#include "frostcoord/store/approval_audit_store.hpp"

namespace frostcoord {

struct PermissionDecision {
  bool allowed = false;
  bool requires_approval = false;
  uint32_t approval_threshold = 1;
  std::string reason;
  std::optional<std::string> permission_id;
};

// Role-table lookups live behind this interface.
class PermissionService {
 public:
  virtual ~PermissionService() = default;

  virtual PermissionDecision CanSign(const GroupId& group_id,
                                     const ParticipantId& requester_id,
                                     const std::string& event_type) = 0;
  // Roles allowed to approve or reject under `permission_id`. Throws if the
  // permission cannot be resolved.
  virtual std::vector<std::string> ApproverRoles(const std::string& permission_id) = 0;
};

enum class GateDecision {
  kCreated,
  kPendingApproval,
  kDenied,
};

struct GateOutcome {
  GateDecision decision = GateDecision::kDenied;
  std::optional<Session> session;
  std::optional<std::string> approval_id;
  uint32_t approvals = 0;
  uint32_t approval_threshold = 0;
  std::string reason;
};

class ApprovalGate {
 public:
  ApprovalGate(SessionLifecycle& lifecycle,
               std::shared_ptr<PermissionService> permissions,
               std::shared_ptr<ApprovalAuditService> audit);

  GateOutcome RequestSession(const CreateSessionRequest& request,
                             const ParticipantId& requester_id,
                             const std::string& event_type);

  // Each approver counts once. The vote that reaches the threshold creates
  // the session from the stored request.
  GateOutcome Approve(const std::string& approval_id,
                      const ParticipantId& approver_id,
                      const std::string& approver_role);

  void Reject(const std::string& approval_id,
              const ParticipantId& rejecter_id,
              const std::string& rejecter_role,
              const std::string& reason);

  std::vector<ApprovalRequest> ListPendingApprovals(const GroupId& group_id);

 private:
  ApprovalRequest LoadPending(const std::string& approval_id);
  // Fails closed: an unresolvable permission denies like a missing role.
  void RequireAuthority(const ApprovalRequest& approval, const std::string& role, const char* action);

  SessionLifecycle& lifecycle_;
  std::shared_ptr<PermissionService> permissions_;
  std::shared_ptr<ApprovalAuditService> audit_;
};

}  // namespace frostcoord
