#include "frostcoord/protocol/session_lifecycle.hpp"

#include <set>
#include <stdexcept>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/crypto/random.hpp"
#include "frostcoord/protocol/optimistic_retry.hpp"

namespace frostcoord {
namespace {

constexpr int64_t kMillisPerSecond = 1000;
constexpr int64_t kMillisPerDay = 24 * 60 * 60 * kMillisPerSecond;

[[noreturn]] void ThrowValidation(const std::string& reason) {
  throw CoordinatorError(ErrorKind::kValidation, reason);
}

}  // namespace

SessionLifecycle::SessionLifecycle(std::shared_ptr<SessionStore> store, CoordinatorConfig config, Clock clock)
    : store_(std::move(store)), config_(std::move(config)), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("SessionLifecycle requires a store");
  }
  if (!clock_) {
    clock_ = SystemClockMillis;
  }
}

void SessionLifecycle::ValidateCreateRequest(const CreateSessionRequest& request) {
  if (request.group_id.empty()) {
    ThrowValidation("group id must not be empty");
  }
  if (request.message_hash.size() != kMessageHashLen) {
    ThrowValidation("message hash must be exactly 32 bytes");
  }
  if (request.threshold < kMinThreshold || request.threshold > kMaxThreshold) {
    ThrowValidation("threshold must be between 1 and 7, got " + std::to_string(request.threshold));
  }
  if (request.participants.size() < request.threshold) {
    ThrowValidation("participants (" + std::to_string(request.participants.size()) +
                    ") must be at least the threshold (" + std::to_string(request.threshold) + ")");
  }
  std::set<ParticipantId> seen;
  for (const ParticipantId& participant : request.participants) {
    if (participant.empty()) {
      ThrowValidation("participant ids must not be empty");
    }
    if (!seen.insert(participant).second) {
      ThrowValidation("duplicate participant id " + participant);
    }
  }
  if (request.ttl.has_value() && request.ttl->count() <= 0) {
    ThrowValidation("session expiration must be positive");
  }
}

Session SessionLifecycle::CreateSession(const CreateSessionRequest& request) {
  ValidateCreateRequest(request);

  const int64_t now = Now();
  const auto ttl = request.ttl.value_or(config_.session_ttl);

  Session session;
  session.id = Csprng::RandomSessionId();
  session.group_id = request.group_id;
  session.message_hash = request.message_hash;
  session.message_template = request.message_template;
  session.event_type = request.event_type;
  session.created_by = request.created_by;
  session.participants = request.participants;
  session.threshold = request.threshold;
  session.status = SessionStatus::kPending;
  session.created_at = now;
  session.updated_at = now;
  session.expires_at = now + static_cast<int64_t>(ttl.count()) * kMillisPerSecond;

  store_->InsertSession(session);
  Log()->info("created session {} for group {}: {}-of-{}",
              ShortId(session.id),
              session.group_id,
              session.threshold,
              session.participants.size());
  return session;
}

Session SessionLifecycle::GetSession(const SessionId& session_id) {
  auto session = store_->FindSession(session_id);
  if (!session.has_value()) {
    throw CoordinatorError(ErrorKind::kNotFound, "session not found: " + session_id);
  }
  return std::move(*session);
}

Session SessionLifecycle::LoadForMutation(const SessionId& session_id, int64_t now_ms) {
  Session session = GetSession(session_id);
  if (session.IsExpiredAt(now_ms)) {
    Log()->warn("rejected mutation of expired session {}", ShortId(session_id));
    throw CoordinatorError(ErrorKind::kExpiration, "session has expired");
  }
  return session;
}

void SessionLifecycle::CommitUpdate(Session& updated, int64_t read_token, int64_t now_ms) {
  updated.updated_at = NextUpdateToken(read_token, now_ms);
  if (!store_->UpdateSessionIfUnchanged(updated, read_token)) {
    throw CoordinatorError(ErrorKind::kConcurrency,
                           "session was modified concurrently, retry with a fresh read");
  }
}

Session SessionLifecycle::FailSession(const SessionId& session_id, const std::string& reason) {
  return RetryOnConflict(config_.optimistic_retry_limit, session_id, "fail session", [&]() {
    const int64_t now = Now();
    Session session = LoadForMutation(session_id, now);
    if (IsTerminal(session.status)) {
      throw CoordinatorError(ErrorKind::kState,
                             std::string("session is already ") + SessionStatusName(session.status));
    }
    const int64_t read_token = session.updated_at;
    session.status = SessionStatus::kFailed;
    session.error_message = reason;
    session.failed_at = now;
    CommitUpdate(session, read_token, now);
    Log()->info("session {} failed: {}", ShortId(session_id), reason);
    return session;
  });
}

size_t SessionLifecycle::ExpireStaleSessions() {
  const size_t expired = store_->ExpireSessions(Now(), kSessionTimeoutMessage);
  if (expired > 0) {
    Log()->info("expired {} stale sessions", expired);
  }
  return expired;
}

size_t SessionLifecycle::CleanupOldSessions() {
  return CleanupOldSessions(config_.retention_days);
}

size_t SessionLifecycle::CleanupOldSessions(uint32_t retention_days) {
  const int64_t cutoff = Now() - static_cast<int64_t>(retention_days) * kMillisPerDay;
  const size_t deleted = store_->DeleteTerminalSessionsCreatedBefore(cutoff);
  Log()->info("retention cleanup removed {} sessions older than {} days", deleted, retention_days);
  return deleted;
}

bool SessionLifecycle::TransitionToAggregating(const SessionId& session_id) {
  const int64_t now = Now();
  LoadForMutation(session_id, now);
  const bool won = store_->UpdateStatusIf(session_id, SessionStatus::kSigning, SessionStatus::kAggregating, now);
  if (won) {
    Log()->info("session {} moved to aggregating", ShortId(session_id));
  } else {
    Log()->debug("session {} was not in signing, aggregation not claimed", ShortId(session_id));
  }
  return won;
}

std::vector<Session> SessionLifecycle::ListActiveSessions(const GroupId& group_id) {
  SessionFilter filter;
  filter.group_id = group_id;
  filter.statuses = {SessionStatus::kPending, SessionStatus::kNonceCollection, SessionStatus::kSigning,
                     SessionStatus::kAggregating};
  return store_->ListSessions(filter);
}

std::vector<Session> SessionLifecycle::ListPendingSessionsFor(const ParticipantId& participant_id) {
  SessionFilter filter;
  filter.participant_id = participant_id;
  filter.statuses = {SessionStatus::kPending, SessionStatus::kNonceCollection};
  return store_->ListSessions(filter);
}

int64_t SessionLifecycle::Now() const {
  return clock_();
}

SessionStore& SessionLifecycle::store() {
  return *store_;
}

const CoordinatorConfig& SessionLifecycle::config() const {
  return config_;
}

}  // namespace frostcoord
