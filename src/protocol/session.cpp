#include "frostcoord/protocol/session.hpp"

#include <algorithm>
#include <stdexcept>

namespace frostcoord {

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kPending:
      return "pending";
    case SessionStatus::kNonceCollection:
      return "nonce_collection";
    case SessionStatus::kSigning:
      return "signing";
    case SessionStatus::kAggregating:
      return "aggregating";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kFailed:
      return "failed";
    case SessionStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

SessionStatus ParseSessionStatus(std::string_view name) {
  static constexpr SessionStatus kAll[] = {
      SessionStatus::kPending,   SessionStatus::kNonceCollection, SessionStatus::kSigning,
      SessionStatus::kAggregating, SessionStatus::kCompleted,     SessionStatus::kFailed,
      SessionStatus::kExpired,
  };
  for (SessionStatus status : kAll) {
    if (name == SessionStatusName(status)) {
      return status;
    }
  }
  throw std::invalid_argument("unknown session status: " + std::string(name));
}

bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted ||
         status == SessionStatus::kFailed ||
         status == SessionStatus::kExpired;
}

bool Session::HasParticipant(const ParticipantId& participant_id) const {
  return std::find(participants.begin(), participants.end(), participant_id) != participants.end();
}

bool Session::IsExpiredAt(int64_t now_ms) const {
  return expires_at < now_ms;
}

uint32_t Session::ParticipantIndex(const ParticipantId& participant_id) const {
  const auto it = std::find(participants.begin(), participants.end(), participant_id);
  if (it == participants.end()) {
    throw std::invalid_argument("participant is not part of the session");
  }
  return static_cast<uint32_t>(std::distance(participants.begin(), it) + 1);
}

int64_t NextUpdateToken(int64_t previous, int64_t now_ms) {
  return std::max(now_ms, previous + 1);
}

}  // namespace frostcoord
