#include "frostcoord/store/in_memory_session_store.hpp"

#include <algorithm>

#include "frostcoord/common/errors.hpp"

namespace frostcoord {

void InMemorySessionStore::RunInTransaction(const std::function<void()>& body) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (transaction_depth_ > 0) {
    ++transaction_depth_;
    try {
      body();
    } catch (...) {
      --transaction_depth_;
      throw;
    }
    --transaction_depth_;
    return;
  }

  State snapshot = state_;
  transaction_depth_ = 1;
  try {
    body();
  } catch (...) {
    state_ = std::move(snapshot);
    transaction_depth_ = 0;
    throw;
  }
  transaction_depth_ = 0;
}

void InMemorySessionStore::InsertSession(const Session& session) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (state_.sessions.count(session.id) != 0) {
    throw CoordinatorError(ErrorKind::kStorage, "session id already exists");
  }
  Session stored = session;
  stored.nonce_commitments.clear();
  state_.sessions.emplace(stored.id, std::move(stored));
}

Session InMemorySessionStore::WithLedgerView(const Session& stored) const {
  Session out = stored;
  out.nonce_commitments.clear();
  for (const NonceCommitmentRecord& record : state_.ledger) {
    if (record.session_id == stored.id) {
      out.nonce_commitments.emplace(record.participant_id, record.commitment);
    }
  }
  return out;
}

std::optional<Session> InMemorySessionStore::FindSession(const SessionId& id) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  const auto it = state_.sessions.find(id);
  if (it == state_.sessions.end()) {
    return std::nullopt;
  }
  return WithLedgerView(it->second);
}

std::vector<Session> InMemorySessionStore::ListSessions(const SessionFilter& filter) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::vector<Session> out;
  for (const auto& [id, session] : state_.sessions) {
    if (filter.group_id.has_value() && session.group_id != *filter.group_id) {
      continue;
    }
    if (filter.participant_id.has_value() && !session.HasParticipant(*filter.participant_id)) {
      continue;
    }
    if (!filter.statuses.empty() && filter.statuses.count(session.status) == 0) {
      continue;
    }
    out.push_back(WithLedgerView(session));
  }
  std::sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id < b.id;
  });
  return out;
}

bool InMemorySessionStore::UpdateSessionIfUnchanged(const Session& updated, int64_t expected_updated_at) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  const auto it = state_.sessions.find(updated.id);
  if (it == state_.sessions.end() || it->second.updated_at != expected_updated_at) {
    return false;
  }
  Session stored = updated;
  stored.nonce_commitments.clear();
  // Identity columns are immutable, as in the SQLite schema.
  stored.group_id = it->second.group_id;
  stored.message_hash = it->second.message_hash;
  stored.participants = it->second.participants;
  stored.threshold = it->second.threshold;
  stored.created_at = it->second.created_at;
  it->second = std::move(stored);
  return true;
}

bool InMemorySessionStore::UpdateStatusIf(const SessionId& id,
                                          SessionStatus expected,
                                          SessionStatus next,
                                          int64_t now_ms) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  const auto it = state_.sessions.find(id);
  if (it == state_.sessions.end() || it->second.status != expected) {
    return false;
  }
  it->second.status = next;
  it->second.updated_at = NextUpdateToken(it->second.updated_at, now_ms);
  return true;
}

size_t InMemorySessionStore::ExpireSessions(int64_t now_ms, const std::string& reason) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  size_t expired = 0;
  for (auto& [id, session] : state_.sessions) {
    if (IsTerminal(session.status) || !session.IsExpiredAt(now_ms)) {
      continue;
    }
    session.status = SessionStatus::kExpired;
    session.error_message = reason;
    session.updated_at = NextUpdateToken(session.updated_at, now_ms);
    ++expired;
  }
  return expired;
}

size_t InMemorySessionStore::DeleteTerminalSessionsCreatedBefore(int64_t cutoff_ms) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  size_t deleted = 0;
  for (auto it = state_.sessions.begin(); it != state_.sessions.end();) {
    if (IsTerminal(it->second.status) && it->second.created_at < cutoff_ms) {
      it = state_.sessions.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return deleted;
}

void InMemorySessionStore::InsertNonceCommitment(const NonceCommitmentRecord& record) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (const NonceCommitmentRecord& existing : state_.ledger) {
    if (existing.commitment == record.commitment) {
      throw CoordinatorError(ErrorKind::kSecurity, "nonce commitment has already been used");
    }
  }
  for (const NonceCommitmentRecord& existing : state_.ledger) {
    if (existing.session_id == record.session_id && existing.participant_id == record.participant_id) {
      throw CoordinatorError(ErrorKind::kValidation,
                             "participant already submitted a nonce commitment for this session");
    }
  }
  state_.ledger.push_back(record);
}

bool InMemorySessionStore::MarkNonceUsed(const SessionId& session_id,
                                         const ParticipantId& participant_id,
                                         const std::string& commitment,
                                         int64_t now_ms) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (NonceCommitmentRecord& record : state_.ledger) {
    if (record.session_id == session_id && record.participant_id == participant_id &&
        record.commitment == commitment && !record.used) {
      record.used = true;
      record.used_at = now_ms;
      return true;
    }
  }
  return false;
}

std::vector<NonceCommitmentRecord> InMemorySessionStore::ListNonceCommitments(const SessionId& session_id) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::vector<NonceCommitmentRecord> out;
  for (const NonceCommitmentRecord& record : state_.ledger) {
    if (record.session_id == session_id) {
      out.push_back(record);
    }
  }
  return out;
}

}  // namespace frostcoord
