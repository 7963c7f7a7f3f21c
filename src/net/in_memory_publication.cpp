#include "frostcoord/net/in_memory_publication.hpp"

#include <stdexcept>

namespace frostcoord {

std::string InMemoryPublicationAdapter::Publish(const PublicationRequest& request) {
  std::lock_guard<std::mutex> lock(mu_);
  if (failure_.has_value()) {
    throw std::runtime_error(*failure_);
  }
  published_.push_back(request);
  return "publication-" + std::to_string(published_.size());
}

void InMemoryPublicationAdapter::SetFailure(std::optional<std::string> failure) {
  std::lock_guard<std::mutex> lock(mu_);
  failure_ = std::move(failure);
}

std::vector<PublicationRequest> InMemoryPublicationAdapter::published() const {
  std::lock_guard<std::mutex> lock(mu_);
  return published_;
}

void InMemoryNotifier::Notify(const CompletionNotice& notice) {
  std::vector<NoticeHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    delivered_.push_back(notice);
    handlers = handlers_;
  }
  for (const auto& handler : handlers) {
    handler(notice);
  }
}

void InMemoryNotifier::RegisterHandler(NoticeHandler handler) {
  if (!handler) {
    throw std::invalid_argument("InMemoryNotifier handler must be callable");
  }
  std::lock_guard<std::mutex> lock(mu_);
  handlers_.push_back(std::move(handler));
}

std::vector<CompletionNotice> InMemoryNotifier::delivered() const {
  std::lock_guard<std::mutex> lock(mu_);
  return delivered_;
}

}  // namespace frostcoord
