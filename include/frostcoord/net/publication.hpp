#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/session.hpp"

namespace frostcoord {

struct PublicationRequest {
  SessionId session_id;
  GroupId group_id;
  ECPoint group_public_key;
  SchnorrSignature final_signature;
  std::string message_template;
};

// Sent to every participant when a session completes or fails.
struct CompletionNotice {
  SessionId session_id;
  SessionStatus status = SessionStatus::kCompleted;
  std::optional<std::string> publication_id;
  std::vector<ParticipantId> recipients;
};

using NoticeHandler = std::function<void(const CompletionNotice& notice)>;

// Transmits a signed payload (e.g. to relays). Returns an opaque publication
// id; throws on failure.
class IPublicationAdapter {
 public:
  virtual ~IPublicationAdapter() = default;

  virtual std::string Publish(const PublicationRequest& request) = 0;
};

class INotifier {
 public:
  virtual ~INotifier() = default;

  virtual void Notify(const CompletionNotice& notice) = 0;
};

}  // namespace frostcoord
