#include "frostcoord/store/sqlite_session_store.hpp"

#include <stdexcept>

#include "frostcoord/crypto/encoding.hpp"

namespace frostcoord {
namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS frost_signing_sessions (
  session_id TEXT PRIMARY KEY,
  group_id TEXT NOT NULL,
  message_hash TEXT NOT NULL CHECK (length(message_hash) = 64),
  message_template TEXT,
  event_type TEXT,
  created_by TEXT NOT NULL,
  threshold INTEGER NOT NULL CHECK (threshold >= 1 AND threshold <= 7),
  final_signature_r TEXT,
  final_signature_s TEXT,
  status TEXT NOT NULL CHECK (status IN ('pending', 'nonce_collection', 'signing',
                                         'aggregating', 'completed', 'failed', 'expired')),
  created_at INTEGER NOT NULL,
  updated_at INTEGER NOT NULL,
  expires_at INTEGER NOT NULL,
  nonce_collection_started_at INTEGER,
  signing_started_at INTEGER,
  completed_at INTEGER,
  failed_at INTEGER,
  error_message TEXT,
  publication_id TEXT,
  CHECK ((status = 'completed') =
         (final_signature_r IS NOT NULL AND final_signature_s IS NOT NULL))
);
CREATE INDEX IF NOT EXISTS idx_frost_sessions_group ON frost_signing_sessions (group_id, status);
CREATE INDEX IF NOT EXISTS idx_frost_sessions_expiry ON frost_signing_sessions (status, expires_at);

CREATE TABLE IF NOT EXISTS frost_session_participants (
  session_id TEXT NOT NULL REFERENCES frost_signing_sessions (session_id) ON DELETE CASCADE,
  position INTEGER NOT NULL,
  participant_id TEXT NOT NULL CHECK (length(participant_id) > 0),
  PRIMARY KEY (session_id, position),
  UNIQUE (session_id, participant_id)
);
CREATE INDEX IF NOT EXISTS idx_frost_participants_participant
  ON frost_session_participants (participant_id);

CREATE TABLE IF NOT EXISTS frost_partial_signatures (
  session_id TEXT NOT NULL REFERENCES frost_signing_sessions (session_id) ON DELETE CASCADE,
  participant_id TEXT NOT NULL,
  signature_share TEXT NOT NULL,
  PRIMARY KEY (session_id, participant_id)
);

CREATE TABLE IF NOT EXISTS frost_nonce_commitments (
  session_id TEXT NOT NULL,
  participant_id TEXT NOT NULL,
  nonce_commitment TEXT NOT NULL,
  nonce_used INTEGER NOT NULL DEFAULT 0,
  created_at INTEGER NOT NULL,
  used_at INTEGER,
  CONSTRAINT unique_nonce_commitment UNIQUE (nonce_commitment),
  CONSTRAINT unique_participant_session UNIQUE (session_id, participant_id),
  CHECK ((nonce_used = 1 AND used_at IS NOT NULL) OR (nonce_used = 0 AND used_at IS NULL))
);
)sql";

constexpr const char* kSelectSession =
    "SELECT session_id, group_id, message_hash, message_template, event_type, created_by, "
    "threshold, final_signature_r, final_signature_s, status, created_at, updated_at, "
    "expires_at, nonce_collection_started_at, signing_started_at, completed_at, failed_at, "
    "error_message, publication_id FROM frost_signing_sessions";

constexpr const char* kTerminalStatuses = "('completed', 'failed', 'expired')";

Session ReadSessionRow(const SqliteStatement& row) {
  Session session;
  session.id = row.ColumnText(0);
  session.group_id = row.ColumnText(1);
  session.message_hash = HexDecode(row.ColumnText(2));
  session.message_template = row.ColumnOptionalText(3);
  session.event_type = row.ColumnOptionalText(4);
  session.created_by = row.ColumnText(5);
  session.threshold = static_cast<uint32_t>(row.ColumnInt64(6));
  const auto sig_r = row.ColumnOptionalText(7);
  const auto sig_s = row.ColumnOptionalText(8);
  if (sig_r.has_value() && sig_s.has_value()) {
    session.final_signature = SchnorrSignature{DecodePointHex(*sig_r), DecodeScalarHex(*sig_s)};
  }
  session.status = ParseSessionStatus(row.ColumnText(9));
  session.created_at = row.ColumnInt64(10);
  session.updated_at = row.ColumnInt64(11);
  session.expires_at = row.ColumnInt64(12);
  session.nonce_collection_started_at = row.ColumnOptionalInt64(13);
  session.signing_started_at = row.ColumnOptionalInt64(14);
  session.completed_at = row.ColumnOptionalInt64(15);
  session.failed_at = row.ColumnOptionalInt64(16);
  session.error_message = row.ColumnOptionalText(17);
  session.publication_id = row.ColumnOptionalText(18);
  return session;
}

std::optional<std::string> SignatureR(const Session& session) {
  if (!session.final_signature.has_value()) {
    return std::nullopt;
  }
  return EncodePointHex(session.final_signature->R);
}

std::optional<std::string> SignatureS(const Session& session) {
  if (!session.final_signature.has_value()) {
    return std::nullopt;
  }
  return EncodeScalarHex(session.final_signature->s);
}

}  // namespace

SqliteSessionStore::SqliteSessionStore(std::shared_ptr<SqliteDatabase> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("SqliteSessionStore requires a database");
  }
  CreateSchema();
}

void SqliteSessionStore::CreateSchema() {
  db_->Execute(kSchema);
}

void SqliteSessionStore::RunInTransaction(const std::function<void()>& body) {
  db_->RunInTransaction(body);
}

void SqliteSessionStore::InsertSession(const Session& session) {
  db_->RunInTransaction([&]() {
    auto insert = db_->Prepare(
        "INSERT INTO frost_signing_sessions (session_id, group_id, message_hash, message_template, "
        "event_type, created_by, threshold, final_signature_r, final_signature_s, status, "
        "created_at, updated_at, expires_at, nonce_collection_started_at, signing_started_at, "
        "completed_at, failed_at, error_message, publication_id) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19)");
    insert.Bind(1, session.id)
        .Bind(2, session.group_id)
        .Bind(3, HexEncode(session.message_hash))
        .Bind(4, session.message_template)
        .Bind(5, session.event_type)
        .Bind(6, session.created_by)
        .Bind(7, static_cast<int64_t>(session.threshold))
        .Bind(8, SignatureR(session))
        .Bind(9, SignatureS(session))
        .Bind(10, std::string(SessionStatusName(session.status)))
        .Bind(11, session.created_at)
        .Bind(12, session.updated_at)
        .Bind(13, session.expires_at)
        .Bind(14, session.nonce_collection_started_at)
        .Bind(15, session.signing_started_at)
        .Bind(16, session.completed_at)
        .Bind(17, session.failed_at)
        .Bind(18, session.error_message)
        .Bind(19, session.publication_id);
    insert.Run();

    for (size_t i = 0; i < session.participants.size(); ++i) {
      auto participant = db_->Prepare(
          "INSERT INTO frost_session_participants (session_id, position, participant_id) "
          "VALUES (?1, ?2, ?3)");
      participant.Bind(1, session.id).Bind(2, static_cast<int64_t>(i)).Bind(3, session.participants[i]);
      participant.Run();
    }
    WritePartialSignatures(session);
  });
}

std::optional<Session> SqliteSessionStore::FindSession(const SessionId& id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto select = db_->Prepare(std::string(kSelectSession) + " WHERE session_id = ?1");
  select.Bind(1, id);
  if (!select.Step()) {
    return std::nullopt;
  }
  Session session = ReadSessionRow(select);

  auto participants = db_->Prepare(
      "SELECT participant_id FROM frost_session_participants WHERE session_id = ?1 ORDER BY position");
  participants.Bind(1, id);
  while (participants.Step()) {
    session.participants.push_back(participants.ColumnText(0));
  }

  auto shares = db_->Prepare(
      "SELECT participant_id, signature_share FROM frost_partial_signatures WHERE session_id = ?1");
  shares.Bind(1, id);
  while (shares.Step()) {
    session.partial_signatures.emplace(shares.ColumnText(0), shares.ColumnText(1));
  }

  auto commitments = db_->Prepare(
      "SELECT participant_id, nonce_commitment FROM frost_nonce_commitments WHERE session_id = ?1");
  commitments.Bind(1, id);
  while (commitments.Step()) {
    session.nonce_commitments.emplace(commitments.ColumnText(0), commitments.ColumnText(1));
  }
  return session;
}

std::vector<Session> SqliteSessionStore::ListSessions(const SessionFilter& filter) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql = "SELECT s.session_id FROM frost_signing_sessions s WHERE 1 = 1";
  int next_param = 1;
  int group_param = 0;
  int participant_param = 0;
  if (filter.group_id.has_value()) {
    group_param = next_param++;
    sql += " AND s.group_id = ?" + std::to_string(group_param);
  }
  if (filter.participant_id.has_value()) {
    participant_param = next_param++;
    sql += " AND EXISTS (SELECT 1 FROM frost_session_participants p WHERE p.session_id = s.session_id"
           " AND p.participant_id = ?" +
           std::to_string(participant_param) + ")";
  }
  if (!filter.statuses.empty()) {
    sql += " AND s.status IN (";
    bool first = true;
    for (SessionStatus status : filter.statuses) {
      sql += first ? "'" : ", '";
      sql += SessionStatusName(status);
      sql += "'";
      first = false;
    }
    sql += ")";
  }
  sql += " ORDER BY s.created_at DESC, s.session_id";

  auto select = db_->Prepare(sql);
  if (group_param != 0) {
    select.Bind(group_param, *filter.group_id);
  }
  if (participant_param != 0) {
    select.Bind(participant_param, *filter.participant_id);
  }
  std::vector<SessionId> ids;
  while (select.Step()) {
    ids.push_back(select.ColumnText(0));
  }

  std::vector<Session> out;
  out.reserve(ids.size());
  for (const SessionId& id : ids) {
    auto session = FindSession(id);
    if (session.has_value()) {
      out.push_back(std::move(*session));
    }
  }
  return out;
}

bool SqliteSessionStore::UpdateSessionIfUnchanged(const Session& updated, int64_t expected_updated_at) {
  bool written = false;
  db_->RunInTransaction([&]() {
    auto update = db_->Prepare(
        "UPDATE frost_signing_sessions SET message_template = ?1, final_signature_r = ?2, "
        "final_signature_s = ?3, status = ?4, updated_at = ?5, expires_at = ?6, "
        "nonce_collection_started_at = ?7, signing_started_at = ?8, completed_at = ?9, "
        "failed_at = ?10, error_message = ?11, publication_id = ?12 "
        "WHERE session_id = ?13 AND updated_at = ?14");
    update.Bind(1, updated.message_template)
        .Bind(2, SignatureR(updated))
        .Bind(3, SignatureS(updated))
        .Bind(4, std::string(SessionStatusName(updated.status)))
        .Bind(5, updated.updated_at)
        .Bind(6, updated.expires_at)
        .Bind(7, updated.nonce_collection_started_at)
        .Bind(8, updated.signing_started_at)
        .Bind(9, updated.completed_at)
        .Bind(10, updated.failed_at)
        .Bind(11, updated.error_message)
        .Bind(12, updated.publication_id)
        .Bind(13, updated.id)
        .Bind(14, expected_updated_at);
    update.Run();
    if (db_->Changes() == 0) {
      return;
    }
    auto clear = db_->Prepare("DELETE FROM frost_partial_signatures WHERE session_id = ?1");
    clear.Bind(1, updated.id);
    clear.Run();
    WritePartialSignatures(updated);
    written = true;
  });
  return written;
}

void SqliteSessionStore::WritePartialSignatures(const Session& session) {
  for (const auto& [participant_id, share] : session.partial_signatures) {
    auto insert = db_->Prepare(
        "INSERT INTO frost_partial_signatures (session_id, participant_id, signature_share) "
        "VALUES (?1, ?2, ?3)");
    insert.Bind(1, session.id).Bind(2, participant_id).Bind(3, share);
    insert.Run();
  }
}

bool SqliteSessionStore::UpdateStatusIf(const SessionId& id,
                                        SessionStatus expected,
                                        SessionStatus next,
                                        int64_t now_ms) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto update = db_->Prepare(
      "UPDATE frost_signing_sessions SET status = ?1, updated_at = MAX(?2, updated_at + 1) "
      "WHERE session_id = ?3 AND status = ?4");
  update.Bind(1, std::string(SessionStatusName(next)))
      .Bind(2, now_ms)
      .Bind(3, id)
      .Bind(4, std::string(SessionStatusName(expected)));
  update.Run();
  return db_->Changes() == 1;
}

size_t SqliteSessionStore::ExpireSessions(int64_t now_ms, const std::string& reason) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto update = db_->Prepare(
      std::string("UPDATE frost_signing_sessions SET status = 'expired', error_message = ?1, "
                  "updated_at = MAX(?2, updated_at + 1) WHERE expires_at < ?2 AND status NOT IN ") +
      kTerminalStatuses);
  update.Bind(1, reason).Bind(2, now_ms);
  update.Run();
  return static_cast<size_t>(db_->Changes());
}

size_t SqliteSessionStore::DeleteTerminalSessionsCreatedBefore(int64_t cutoff_ms) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto remove = db_->Prepare(
      std::string("DELETE FROM frost_signing_sessions WHERE created_at < ?1 AND status IN ") +
      kTerminalStatuses);
  remove.Bind(1, cutoff_ms);
  remove.Run();
  return static_cast<size_t>(db_->Changes());
}

void SqliteSessionStore::InsertNonceCommitment(const NonceCommitmentRecord& record) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto insert = db_->Prepare(
      "INSERT INTO frost_nonce_commitments (session_id, participant_id, nonce_commitment, "
      "nonce_used, created_at, used_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
  insert.Bind(1, record.session_id)
      .Bind(2, record.participant_id)
      .Bind(3, record.commitment)
      .Bind(4, static_cast<int64_t>(record.used ? 1 : 0))
      .Bind(5, record.created_at)
      .Bind(6, record.used_at);
  try {
    insert.Run();
  } catch (const SqliteConstraintError& e) {
    const std::string message = e.what();
    if (message.find("frost_nonce_commitments.nonce_commitment") != std::string::npos) {
      throw CoordinatorError(ErrorKind::kSecurity, "nonce commitment has already been used");
    }
    if (message.find("frost_nonce_commitments.session_id") != std::string::npos) {
      throw CoordinatorError(ErrorKind::kValidation,
                             "participant already submitted a nonce commitment for this session");
    }
    throw;
  }
}

bool SqliteSessionStore::MarkNonceUsed(const SessionId& session_id,
                                       const ParticipantId& participant_id,
                                       const std::string& commitment,
                                       int64_t now_ms) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto update = db_->Prepare(
      "UPDATE frost_nonce_commitments SET nonce_used = 1, used_at = ?1 "
      "WHERE session_id = ?2 AND participant_id = ?3 AND nonce_commitment = ?4 AND nonce_used = 0");
  update.Bind(1, now_ms).Bind(2, session_id).Bind(3, participant_id).Bind(4, commitment);
  update.Run();
  return db_->Changes() == 1;
}

std::vector<NonceCommitmentRecord> SqliteSessionStore::ListNonceCommitments(const SessionId& session_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto select = db_->Prepare(
      "SELECT session_id, participant_id, nonce_commitment, nonce_used, created_at, used_at "
      "FROM frost_nonce_commitments WHERE session_id = ?1 ORDER BY created_at, participant_id");
  select.Bind(1, session_id);
  std::vector<NonceCommitmentRecord> out;
  while (select.Step()) {
    NonceCommitmentRecord record;
    record.session_id = select.ColumnText(0);
    record.participant_id = select.ColumnText(1);
    record.commitment = select.ColumnText(2);
    record.used = select.ColumnInt64(3) != 0;
    record.created_at = select.ColumnInt64(4);
    record.used_at = select.ColumnOptionalInt64(5);
    out.push_back(std::move(record));
  }
  return out;
}

}  // namespace frostcoord
