#include "frostcoord/common/errors.hpp"

namespace frostcoord {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kState:
      return "state";
    case ErrorKind::kSecurity:
      return "security";
    case ErrorKind::kConcurrency:
      return "concurrency";
    case ErrorKind::kAggregation:
      return "aggregation";
    case ErrorKind::kExpiration:
      return "expiration";
    case ErrorKind::kPublication:
      return "publication";
    case ErrorKind::kStorage:
      return "storage";
  }
  return "unknown";
}

CoordinatorError::CoordinatorError(ErrorKind kind, const std::string& reason)
    : std::runtime_error(reason), kind_(kind) {}

ErrorKind CoordinatorError::kind() const {
  return kind_;
}

bool CoordinatorError::IsRetryable() const {
  return kind_ == ErrorKind::kConcurrency;
}

}  // namespace frostcoord
