#include "frostcoord/protocol/completion_publisher.hpp"

#include <exception>
#include <stdexcept>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/protocol/optimistic_retry.hpp"

namespace frostcoord {

void DeliverNotice(const std::shared_ptr<INotifier>& notifier, const CompletionNotice& notice) {
  if (!notifier) {
    return;
  }
  try {
    notifier->Notify(notice);
  } catch (const std::exception& e) {
    Log()->error("notification for session {} failed: {}", ShortId(notice.session_id), e.what());
  }
}

CompletionPublisher::CompletionPublisher(SessionLifecycle& lifecycle,
                                         std::shared_ptr<GroupKeyDirectory> group_keys,
                                         std::shared_ptr<IPublicationAdapter> adapter,
                                         std::shared_ptr<INotifier> notifier)
    : lifecycle_(lifecycle),
      group_keys_(std::move(group_keys)),
      adapter_(std::move(adapter)),
      notifier_(std::move(notifier)) {
  if (!group_keys_) {
    throw std::invalid_argument("CompletionPublisher requires a group key directory");
  }
  if (!adapter_) {
    throw std::invalid_argument("CompletionPublisher requires a publication adapter");
  }
}

std::string CompletionPublisher::PublishCompletedSession(const SessionId& session_id) {
  Session session = lifecycle_.GetSession(session_id);
  if (session.status != SessionStatus::kCompleted || !session.final_signature.has_value()) {
    throw CoordinatorError(ErrorKind::kState,
                           std::string("only completed sessions can be published (status ") +
                               SessionStatusName(session.status) + ")");
  }
  if (!session.message_template.has_value()) {
    throw CoordinatorError(ErrorKind::kValidation, "session has no message template to publish");
  }
  if (session.publication_id.has_value()) {
    throw CoordinatorError(ErrorKind::kState, "session was already published as " + *session.publication_id);
  }
  const auto group_public_key = group_keys_->FindGroupPublicKey(session.group_id);
  if (!group_public_key.has_value()) {
    throw CoordinatorError(ErrorKind::kNotFound, "no group public key for group " + session.group_id);
  }

  PublicationRequest request{session.id, session.group_id, *group_public_key, *session.final_signature,
                             *session.message_template};
  std::string publication_id;
  try {
    publication_id = adapter_->Publish(request);
  } catch (const std::exception& e) {
    Log()->error("publication of session {} failed: {}", ShortId(session_id), e.what());
    throw CoordinatorError(ErrorKind::kPublication, std::string("publication failed: ") + e.what());
  }

  RetryOnConflict(lifecycle_.config().optimistic_retry_limit, session_id, "publication", [&]() {
    Session current = lifecycle_.GetSession(session_id);
    const int64_t read_token = current.updated_at;
    current.publication_id = publication_id;
    lifecycle_.CommitUpdate(current, read_token, lifecycle_.Now());
  });
  Log()->info("session {} published as {}", ShortId(session_id), publication_id);

  DeliverNotice(notifier_,
                CompletionNotice{session.id, SessionStatus::kCompleted, publication_id, session.participants});
  return publication_id;
}

}  // namespace frostcoord
