#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "frostcoord/protocol/session.hpp"

namespace frostcoord {

struct SessionFilter {
  std::optional<GroupId> group_id;
  std::optional<ParticipantId> participant_id;
  std::set<SessionStatus> statuses;
};

// Durable home of sessions and the nonce ledger.
//
// A session's nonce_commitments map is a view over the ledger: FindSession
// fills it from the ledger rows of that session, and UpdateSessionIfUnchanged
// ignores it. Ledger rows are append-only and survive session deletion, so a
// commitment value can never be accepted again.
//
// Failures raise CoordinatorError: kSecurity when a commitment value is
// already in the ledger, kValidation when a participant already has a row for
// the session, kStorage for everything the backend reports.
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  // Writes made by `body` commit together, or not at all if it throws.
  // Calls nest; only the outermost call commits.
  virtual void RunInTransaction(const std::function<void()>& body) = 0;

  virtual void InsertSession(const Session& session) = 0;
  virtual std::optional<Session> FindSession(const SessionId& id) = 0;
  virtual std::vector<Session> ListSessions(const SessionFilter& filter) = 0;

  // Conditional write keyed on the lock token. Returns false, writing
  // nothing, if the stored updated_at differs from `expected_updated_at`.
  virtual bool UpdateSessionIfUnchanged(const Session& updated, int64_t expected_updated_at) = 0;

  // Conditional write keyed on status. Returns false if the stored status is
  // not `expected`.
  virtual bool UpdateStatusIf(const SessionId& id,
                              SessionStatus expected,
                              SessionStatus next,
                              int64_t now_ms) = 0;

  virtual size_t ExpireSessions(int64_t now_ms, const std::string& reason) = 0;
  virtual size_t DeleteTerminalSessionsCreatedBefore(int64_t cutoff_ms) = 0;

  virtual void InsertNonceCommitment(const NonceCommitmentRecord& record) = 0;
  // Flips the participant's unused row for this commitment to used. Returns
  // false if there is no such unused row.
  virtual bool MarkNonceUsed(const SessionId& session_id,
                             const ParticipantId& participant_id,
                             const std::string& commitment,
                             int64_t now_ms) = 0;
  virtual std::vector<NonceCommitmentRecord> ListNonceCommitments(const SessionId& session_id) = 0;
};

}  // namespace frostcoord
