#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

enum class SessionStatus : uint32_t {
  kPending = 0,
  kNonceCollection = 1,
  kSigning = 2,
  kAggregating = 3,
  kCompleted = 4,
  kFailed = 5,
  kExpired = 6,
};

const char* SessionStatusName(SessionStatus status);
SessionStatus ParseSessionStatus(std::string_view name);
bool IsTerminal(SessionStatus status);

struct Session {
  SessionId id;
  GroupId group_id;
  Bytes message_hash;
  std::optional<std::string> message_template;
  std::optional<std::string> event_type;
  ParticipantId created_by;

  std::vector<ParticipantId> participants;
  uint32_t threshold = 1;

  // Hex encodings, keyed by participant.
  std::map<ParticipantId, std::string> nonce_commitments;
  std::map<ParticipantId, std::string> partial_signatures;
  std::optional<SchnorrSignature> final_signature;

  SessionStatus status = SessionStatus::kPending;
  int64_t created_at = 0;
  // Optimistic-lock token; strictly increases on every write.
  int64_t updated_at = 0;
  int64_t expires_at = 0;
  std::optional<int64_t> nonce_collection_started_at;
  std::optional<int64_t> signing_started_at;
  std::optional<int64_t> completed_at;
  std::optional<int64_t> failed_at;
  std::optional<std::string> error_message;
  std::optional<std::string> publication_id;

  bool HasParticipant(const ParticipantId& participant_id) const;
  bool IsExpiredAt(int64_t now_ms) const;
  // 1-based position in the participant list, used as the Lagrange index.
  uint32_t ParticipantIndex(const ParticipantId& participant_id) const;
};

struct CreateSessionRequest {
  GroupId group_id;
  Bytes message_hash;
  std::vector<ParticipantId> participants;
  uint32_t threshold = 1;
  // Falls back to the configured session TTL.
  std::optional<std::chrono::seconds> ttl;
  std::optional<std::string> message_template;
  std::optional<std::string> event_type;
  ParticipantId created_by;
};

struct NonceCommitmentRecord {
  SessionId session_id;
  ParticipantId participant_id;
  std::string commitment;
  bool used = false;
  int64_t created_at = 0;
  std::optional<int64_t> used_at;
};

// Next lock token for a record last written at `previous`.
int64_t NextUpdateToken(int64_t previous, int64_t now_ms);

}  // namespace frostcoord
