#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "frostcoord/common/config.hpp"
#include "frostcoord/protocol/session.hpp"
#include "frostcoord/store/session_store.hpp"

namespace frostcoord {

inline constexpr const char* kSessionTimeoutMessage = "Session expired due to timeout";

class SessionLifecycle {
 public:
  SessionLifecycle(std::shared_ptr<SessionStore> store, CoordinatorConfig config, Clock clock);

  // Throws CoordinatorError(kValidation) describing the first problem found.
  static void ValidateCreateRequest(const CreateSessionRequest& request);

  Session CreateSession(const CreateSessionRequest& request);
  Session GetSession(const SessionId& session_id);
  Session FailSession(const SessionId& session_id, const std::string& reason);

  size_t ExpireStaleSessions();
  size_t CleanupOldSessions();
  size_t CleanupOldSessions(uint32_t retention_days);

  // Conditional signing -> aggregating write. Exactly one concurrent caller
  // observes true; the rest should not aggregate.
  bool TransitionToAggregating(const SessionId& session_id);

  std::vector<Session> ListActiveSessions(const GroupId& group_id);
  std::vector<Session> ListPendingSessionsFor(const ParticipantId& participant_id);

  // Reads a session a mutation is about to change: kNotFound if it does not
  // exist, kExpiration if its deadline has passed, whatever its status.
  Session LoadForMutation(const SessionId& session_id, int64_t now_ms);

  // Writes `updated` if the stored token still equals `read_token`, bumping
  // updated.updated_at first. Throws kConcurrency otherwise.
  void CommitUpdate(Session& updated, int64_t read_token, int64_t now_ms);

  int64_t Now() const;
  SessionStore& store();
  const CoordinatorConfig& config() const;

 private:
  std::shared_ptr<SessionStore> store_;
  CoordinatorConfig config_;
  Clock clock_;
};

}  // namespace frostcoord
