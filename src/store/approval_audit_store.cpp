#include "frostcoord/store/approval_audit_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/crypto/encoding.hpp"

namespace frostcoord {
namespace {

constexpr const char* kApprovalSchema = R"sql(
CREATE TABLE IF NOT EXISTS signing_approvals (
  approval_id TEXT PRIMARY KEY,
  group_id TEXT NOT NULL,
  requester_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  permission_id TEXT,
  approval_threshold INTEGER NOT NULL CHECK (approval_threshold >= 1),
  status TEXT NOT NULL CHECK (status IN ('pending', 'approved', 'rejected')),
  message_hash TEXT NOT NULL,
  message_template TEXT,
  session_threshold INTEGER NOT NULL CHECK (session_threshold >= 1 AND session_threshold <= 7),
  ttl_seconds INTEGER,
  rejected_by TEXT,
  rejection_reason TEXT,
  session_id TEXT,
  created_at INTEGER NOT NULL,
  updated_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_signing_approvals_group ON signing_approvals (group_id, status);

CREATE TABLE IF NOT EXISTS signing_approval_participants (
  approval_id TEXT NOT NULL REFERENCES signing_approvals (approval_id) ON DELETE CASCADE,
  position INTEGER NOT NULL,
  participant_id TEXT NOT NULL,
  PRIMARY KEY (approval_id, position)
);

CREATE TABLE IF NOT EXISTS signing_approval_votes (
  approval_id TEXT NOT NULL REFERENCES signing_approvals (approval_id) ON DELETE CASCADE,
  approver_id TEXT NOT NULL,
  approver_role TEXT NOT NULL,
  voted_at INTEGER NOT NULL,
  PRIMARY KEY (approval_id, approver_id)
);
)sql";

[[noreturn]] void ThrowApprovalNotFound(const std::string& approval_id) {
  throw CoordinatorError(ErrorKind::kNotFound, "approval request not found: " + approval_id);
}

}  // namespace

const char* ApprovalStatusName(ApprovalStatus status) {
  switch (status) {
    case ApprovalStatus::kPending:
      return "pending";
    case ApprovalStatus::kApproved:
      return "approved";
    case ApprovalStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

ApprovalStatus ParseApprovalStatus(std::string_view name) {
  if (name == "pending") {
    return ApprovalStatus::kPending;
  }
  if (name == "approved") {
    return ApprovalStatus::kApproved;
  }
  if (name == "rejected") {
    return ApprovalStatus::kRejected;
  }
  throw std::invalid_argument("unknown approval status: " + std::string(name));
}

void InMemoryApprovalAuditService::RecordRequest(const ApprovalRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!requests_.emplace(request.id, request).second) {
    throw CoordinatorError(ErrorKind::kStorage, "approval request already exists: " + request.id);
  }
}

ApprovalRequest& InMemoryApprovalAuditService::Require(const std::string& approval_id) {
  const auto it = requests_.find(approval_id);
  if (it == requests_.end()) {
    ThrowApprovalNotFound(approval_id);
  }
  return it->second;
}

std::optional<ApprovalRequest> InMemoryApprovalAuditService::FindRequest(const std::string& approval_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = requests_.find(approval_id);
  if (it == requests_.end()) {
    return std::nullopt;
  }
  return it->second;
}

uint32_t InMemoryApprovalAuditService::AddVote(const std::string& approval_id, const ApprovalVote& vote) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApprovalRequest& request = Require(approval_id);
  const bool already_voted =
      std::any_of(request.votes.begin(), request.votes.end(),
                  [&](const ApprovalVote& existing) { return existing.approver_id == vote.approver_id; });
  if (!already_voted) {
    request.votes.push_back(vote);
    request.updated_at = vote.voted_at;
  }
  return static_cast<uint32_t>(request.votes.size());
}

bool InMemoryApprovalAuditService::ResolvePending(const std::string& approval_id,
                                                  ApprovalStatus next,
                                                  const std::optional<ParticipantId>& rejected_by,
                                                  const std::optional<std::string>& rejection_reason,
                                                  int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApprovalRequest& request = Require(approval_id);
  if (request.status != ApprovalStatus::kPending) {
    return false;
  }
  request.status = next;
  request.rejected_by = rejected_by;
  request.rejection_reason = rejection_reason;
  request.updated_at = now_ms;
  return true;
}

void InMemoryApprovalAuditService::AttachSession(const std::string& approval_id,
                                                 const SessionId& session_id,
                                                 int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApprovalRequest& request = Require(approval_id);
  request.session_id = session_id;
  request.updated_at = now_ms;
}

std::vector<ApprovalRequest> InMemoryApprovalAuditService::ListPending(const GroupId& group_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ApprovalRequest> out;
  for (const auto& [id, request] : requests_) {
    if (request.status == ApprovalStatus::kPending && request.request.group_id == group_id) {
      out.push_back(request);
    }
  }
  std::sort(out.begin(), out.end(), [](const ApprovalRequest& a, const ApprovalRequest& b) {
    return a.created_at > b.created_at;
  });
  return out;
}

SqliteApprovalAuditService::SqliteApprovalAuditService(std::shared_ptr<SqliteDatabase> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("SqliteApprovalAuditService requires a database");
  }
  db_->Execute(kApprovalSchema);
}

void SqliteApprovalAuditService::RecordRequest(const ApprovalRequest& request) {
  db_->RunInTransaction([&]() {
    std::optional<int64_t> ttl_seconds;
    if (request.request.ttl.has_value()) {
      ttl_seconds = static_cast<int64_t>(request.request.ttl->count());
    }
    auto insert = db_->Prepare(
        "INSERT INTO signing_approvals (approval_id, group_id, requester_id, event_type, "
        "permission_id, approval_threshold, status, message_hash, message_template, "
        "session_threshold, ttl_seconds, rejected_by, rejection_reason, session_id, created_at, "
        "updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16)");
    insert.Bind(1, request.id)
        .Bind(2, request.request.group_id)
        .Bind(3, request.requester_id)
        .Bind(4, request.event_type)
        .Bind(5, request.permission_id)
        .Bind(6, static_cast<int64_t>(request.approval_threshold))
        .Bind(7, std::string(ApprovalStatusName(request.status)))
        .Bind(8, HexEncode(request.request.message_hash))
        .Bind(9, request.request.message_template)
        .Bind(10, static_cast<int64_t>(request.request.threshold))
        .Bind(11, ttl_seconds)
        .Bind(12, request.rejected_by)
        .Bind(13, request.rejection_reason)
        .Bind(14, request.session_id)
        .Bind(15, request.created_at)
        .Bind(16, request.updated_at);
    insert.Run();

    for (size_t i = 0; i < request.request.participants.size(); ++i) {
      auto participant = db_->Prepare(
          "INSERT INTO signing_approval_participants (approval_id, position, participant_id) "
          "VALUES (?1, ?2, ?3)");
      participant.Bind(1, request.id).Bind(2, static_cast<int64_t>(i)).Bind(3, request.request.participants[i]);
      participant.Run();
    }
    for (const ApprovalVote& vote : request.votes) {
      AddVote(request.id, vote);
    }
  });
}

std::optional<ApprovalRequest> SqliteApprovalAuditService::FindRequest(const std::string& approval_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto select = db_->Prepare(
      "SELECT approval_id, group_id, requester_id, event_type, permission_id, approval_threshold, "
      "status, message_hash, message_template, session_threshold, ttl_seconds, rejected_by, "
      "rejection_reason, session_id, created_at, updated_at FROM signing_approvals "
      "WHERE approval_id = ?1");
  select.Bind(1, approval_id);
  if (!select.Step()) {
    return std::nullopt;
  }
  ApprovalRequest out;
  out.id = select.ColumnText(0);
  out.request.group_id = select.ColumnText(1);
  out.requester_id = select.ColumnText(2);
  out.request.created_by = out.requester_id;
  out.event_type = select.ColumnText(3);
  out.request.event_type = out.event_type;
  out.permission_id = select.ColumnOptionalText(4);
  out.approval_threshold = static_cast<uint32_t>(select.ColumnInt64(5));
  out.status = ParseApprovalStatus(select.ColumnText(6));
  out.request.message_hash = HexDecode(select.ColumnText(7));
  out.request.message_template = select.ColumnOptionalText(8);
  out.request.threshold = static_cast<uint32_t>(select.ColumnInt64(9));
  if (const auto ttl_seconds = select.ColumnOptionalInt64(10); ttl_seconds.has_value()) {
    out.request.ttl = std::chrono::seconds(*ttl_seconds);
  }
  out.rejected_by = select.ColumnOptionalText(11);
  out.rejection_reason = select.ColumnOptionalText(12);
  out.session_id = select.ColumnOptionalText(13);
  out.created_at = select.ColumnInt64(14);
  out.updated_at = select.ColumnInt64(15);

  auto participants = db_->Prepare(
      "SELECT participant_id FROM signing_approval_participants WHERE approval_id = ?1 ORDER BY position");
  participants.Bind(1, approval_id);
  while (participants.Step()) {
    out.request.participants.push_back(participants.ColumnText(0));
  }

  auto votes = db_->Prepare(
      "SELECT approver_id, approver_role, voted_at FROM signing_approval_votes "
      "WHERE approval_id = ?1 ORDER BY voted_at, approver_id");
  votes.Bind(1, approval_id);
  while (votes.Step()) {
    out.votes.push_back(ApprovalVote{votes.ColumnText(0), votes.ColumnText(1), votes.ColumnInt64(2)});
  }
  return out;
}

uint32_t SqliteApprovalAuditService::CountVotes(const std::string& approval_id) {
  auto count = db_->Prepare("SELECT COUNT(*) FROM signing_approval_votes WHERE approval_id = ?1");
  count.Bind(1, approval_id);
  if (!count.Step()) {
    return 0;
  }
  return static_cast<uint32_t>(count.ColumnInt64(0));
}

uint32_t SqliteApprovalAuditService::AddVote(const std::string& approval_id, const ApprovalVote& vote) {
  uint32_t votes = 0;
  db_->RunInTransaction([&]() {
    auto exists = db_->Prepare("SELECT 1 FROM signing_approvals WHERE approval_id = ?1");
    exists.Bind(1, approval_id);
    if (!exists.Step()) {
      ThrowApprovalNotFound(approval_id);
    }
    auto insert = db_->Prepare(
        "INSERT INTO signing_approval_votes (approval_id, approver_id, approver_role, voted_at) "
        "VALUES (?1, ?2, ?3, ?4) ON CONFLICT (approval_id, approver_id) DO NOTHING");
    insert.Bind(1, approval_id).Bind(2, vote.approver_id).Bind(3, vote.approver_role).Bind(4, vote.voted_at);
    insert.Run();
    if (db_->Changes() == 1) {
      auto touch = db_->Prepare("UPDATE signing_approvals SET updated_at = ?1 WHERE approval_id = ?2");
      touch.Bind(1, vote.voted_at).Bind(2, approval_id);
      touch.Run();
    }
    votes = CountVotes(approval_id);
  });
  return votes;
}

bool SqliteApprovalAuditService::ResolvePending(const std::string& approval_id,
                                                ApprovalStatus next,
                                                const std::optional<ParticipantId>& rejected_by,
                                                const std::optional<std::string>& rejection_reason,
                                                int64_t now_ms) {
  bool resolved = false;
  db_->RunInTransaction([&]() {
    auto update = db_->Prepare(
        "UPDATE signing_approvals SET status = ?1, rejected_by = ?2, rejection_reason = ?3, "
        "updated_at = ?4 WHERE approval_id = ?5 AND status = 'pending'");
    update.Bind(1, std::string(ApprovalStatusName(next)))
        .Bind(2, rejected_by)
        .Bind(3, rejection_reason)
        .Bind(4, now_ms)
        .Bind(5, approval_id);
    update.Run();
    if (db_->Changes() == 1) {
      resolved = true;
      return;
    }
    auto exists = db_->Prepare("SELECT 1 FROM signing_approvals WHERE approval_id = ?1");
    exists.Bind(1, approval_id);
    if (!exists.Step()) {
      ThrowApprovalNotFound(approval_id);
    }
  });
  return resolved;
}

void SqliteApprovalAuditService::AttachSession(const std::string& approval_id,
                                               const SessionId& session_id,
                                               int64_t now_ms) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto update = db_->Prepare(
      "UPDATE signing_approvals SET session_id = ?1, updated_at = ?2 WHERE approval_id = ?3");
  update.Bind(1, session_id).Bind(2, now_ms).Bind(3, approval_id);
  update.Run();
  if (db_->Changes() == 0) {
    ThrowApprovalNotFound(approval_id);
  }
}

std::vector<ApprovalRequest> SqliteApprovalAuditService::ListPending(const GroupId& group_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto select = db_->Prepare(
      "SELECT approval_id FROM signing_approvals WHERE group_id = ?1 AND status = 'pending' "
      "ORDER BY created_at DESC, approval_id");
  select.Bind(1, group_id);
  std::vector<std::string> ids;
  while (select.Step()) {
    ids.push_back(select.ColumnText(0));
  }
  std::vector<ApprovalRequest> out;
  for (const std::string& id : ids) {
    auto request = FindRequest(id);
    if (request.has_value()) {
      out.push_back(std::move(*request));
    }
  }
  return out;
}

}  // namespace frostcoord
