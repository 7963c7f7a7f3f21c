#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "frostcoord/protocol/session.hpp"
#include "frostcoord/store/sqlite_database.hpp"

namespace frostcoord {

enum class ApprovalStatus : uint32_t {
  kPending = 0,
  kApproved = 1,
  kRejected = 2,
};

const char* ApprovalStatusName(ApprovalStatus status);
ApprovalStatus ParseApprovalStatus(std::string_view name);

struct ApprovalVote {
  ParticipantId approver_id;
  std::string approver_role;
  int64_t voted_at = 0;
};

// A session request parked until enough authorized approvers sign off.
struct ApprovalRequest {
  std::string id;
  CreateSessionRequest request;
  ParticipantId requester_id;
  std::string event_type;
  std::optional<std::string> permission_id;
  uint32_t approval_threshold = 1;
  ApprovalStatus status = ApprovalStatus::kPending;
  std::vector<ApprovalVote> votes;
  std::optional<ParticipantId> rejected_by;
  std::optional<std::string> rejection_reason;
  std::optional<SessionId> session_id;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

// Records approval requests and tallies votes.
class ApprovalAuditService {
 public:
  virtual ~ApprovalAuditService() = default;

  virtual void RecordRequest(const ApprovalRequest& request) = 0;
  virtual std::optional<ApprovalRequest> FindRequest(const std::string& approval_id) = 0;
  // Adds the vote unless the approver already voted; returns the distinct
  // approver count afterwards.
  virtual uint32_t AddVote(const std::string& approval_id, const ApprovalVote& vote) = 0;
  // Moves a pending request to `next`. Returns false if it was not pending.
  virtual bool ResolvePending(const std::string& approval_id,
                              ApprovalStatus next,
                              const std::optional<ParticipantId>& rejected_by,
                              const std::optional<std::string>& rejection_reason,
                              int64_t now_ms) = 0;
  virtual void AttachSession(const std::string& approval_id, const SessionId& session_id, int64_t now_ms) = 0;
  virtual std::vector<ApprovalRequest> ListPending(const GroupId& group_id) = 0;
};

class InMemoryApprovalAuditService : public ApprovalAuditService {
 public:
  void RecordRequest(const ApprovalRequest& request) override;
  std::optional<ApprovalRequest> FindRequest(const std::string& approval_id) override;
  uint32_t AddVote(const std::string& approval_id, const ApprovalVote& vote) override;
  bool ResolvePending(const std::string& approval_id,
                      ApprovalStatus next,
                      const std::optional<ParticipantId>& rejected_by,
                      const std::optional<std::string>& rejection_reason,
                      int64_t now_ms) override;
  void AttachSession(const std::string& approval_id, const SessionId& session_id, int64_t now_ms) override;
  std::vector<ApprovalRequest> ListPending(const GroupId& group_id) override;

 private:
  ApprovalRequest& Require(const std::string& approval_id);

  std::mutex mutex_;
  std::map<std::string, ApprovalRequest> requests_;
};

// Backed by signing_approvals, signing_approval_participants and
// signing_approval_votes.
class SqliteApprovalAuditService : public ApprovalAuditService {
 public:
  explicit SqliteApprovalAuditService(std::shared_ptr<SqliteDatabase> db);

  void RecordRequest(const ApprovalRequest& request) override;
  std::optional<ApprovalRequest> FindRequest(const std::string& approval_id) override;
  uint32_t AddVote(const std::string& approval_id, const ApprovalVote& vote) override;
  bool ResolvePending(const std::string& approval_id,
                      ApprovalStatus next,
                      const std::optional<ParticipantId>& rejected_by,
                      const std::optional<std::string>& rejection_reason,
                      int64_t now_ms) override;
  void AttachSession(const std::string& approval_id, const SessionId& session_id, int64_t now_ms) override;
  std::vector<ApprovalRequest> ListPending(const GroupId& group_id) override;

 private:
  uint32_t CountVotes(const std::string& approval_id);

  std::shared_ptr<SqliteDatabase> db_;
};

}  // namespace frostcoord
