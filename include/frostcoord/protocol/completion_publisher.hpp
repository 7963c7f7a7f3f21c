#pragma once

#include <memory>
#include <string>

#include "frostcoord/net/publication.hpp"
#include "frostcoord/protocol/session_lifecycle.hpp"
#include "frostcoord/store/group_key_directory.hpp"

namespace frostcoord {

// Hands `notice` to the notifier when one is configured. Notifier failures
// are logged and never propagate.
void DeliverNotice(const std::shared_ptr<INotifier>& notifier, const CompletionNotice& notice);

// Hands completed signatures to the publication adapter and tells the
// participants how their session ended. The notifier is optional.
class CompletionPublisher {
 public:
  CompletionPublisher(SessionLifecycle& lifecycle,
                      std::shared_ptr<GroupKeyDirectory> group_keys,
                      std::shared_ptr<IPublicationAdapter> adapter,
                      std::shared_ptr<INotifier> notifier);

  std::string PublishCompletedSession(const SessionId& session_id);

 private:
  SessionLifecycle& lifecycle_;
  std::shared_ptr<GroupKeyDirectory> group_keys_;
  std::shared_ptr<IPublicationAdapter> adapter_;
  std::shared_ptr<INotifier> notifier_;
};

}  // namespace frostcoord
