#pragma once

#include <mutex>
#include <vector>

#include "frostcoord/net/publication.hpp"

namespace frostcoord {

// Records each request and hands back sequential ids. SetFailure makes the
// next calls throw, for exercising the error path.
class InMemoryPublicationAdapter : public IPublicationAdapter {
 public:
  std::string Publish(const PublicationRequest& request) override;

  void SetFailure(std::optional<std::string> failure);
  std::vector<PublicationRequest> published() const;

 private:
  mutable std::mutex mu_;
  std::vector<PublicationRequest> published_;
  std::optional<std::string> failure_;
};

class InMemoryNotifier : public INotifier {
 public:
  void Notify(const CompletionNotice& notice) override;

  void RegisterHandler(NoticeHandler handler);
  std::vector<CompletionNotice> delivered() const;

 private:
  mutable std::mutex mu_;
  std::vector<NoticeHandler> handlers_;
  std::vector<CompletionNotice> delivered_;
};

}  // namespace frostcoord
