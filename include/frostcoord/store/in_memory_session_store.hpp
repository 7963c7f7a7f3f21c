#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "frostcoord/store/session_store.hpp"

namespace frostcoord {

// Process-local store with the same constraints as the SQLite schema. A
// transaction snapshots the state and restores it if the body throws.
class InMemorySessionStore : public SessionStore {
 public:
  void RunInTransaction(const std::function<void()>& body) override;

  void InsertSession(const Session& session) override;
  std::optional<Session> FindSession(const SessionId& id) override;
  std::vector<Session> ListSessions(const SessionFilter& filter) override;
  bool UpdateSessionIfUnchanged(const Session& updated, int64_t expected_updated_at) override;
  bool UpdateStatusIf(const SessionId& id,
                      SessionStatus expected,
                      SessionStatus next,
                      int64_t now_ms) override;
  size_t ExpireSessions(int64_t now_ms, const std::string& reason) override;
  size_t DeleteTerminalSessionsCreatedBefore(int64_t cutoff_ms) override;

  void InsertNonceCommitment(const NonceCommitmentRecord& record) override;
  bool MarkNonceUsed(const SessionId& session_id,
                     const ParticipantId& participant_id,
                     const std::string& commitment,
                     int64_t now_ms) override;
  std::vector<NonceCommitmentRecord> ListNonceCommitments(const SessionId& session_id) override;

 private:
  struct State {
    std::map<SessionId, Session> sessions;
    std::vector<NonceCommitmentRecord> ledger;
  };

  Session WithLedgerView(const Session& stored) const;

  std::recursive_mutex mutex_;
  State state_;
  uint32_t transaction_depth_ = 0;
};

}  // namespace frostcoord
