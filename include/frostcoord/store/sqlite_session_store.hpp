#pragma once

#include <memory>

#include "frostcoord/store/session_store.hpp"
#include "frostcoord/store/sqlite_database.hpp"

namespace frostcoord {

class SqliteSessionStore : public SessionStore {
 public:
  // Creates the schema on first use. The database may be shared with the
  // group key directory and the approval audit service.
  explicit SqliteSessionStore(std::shared_ptr<SqliteDatabase> db);

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
  void CreateSchema();
  void WritePartialSignatures(const Session& session);

  std::shared_ptr<SqliteDatabase> db_;
};

}  // namespace frostcoord
