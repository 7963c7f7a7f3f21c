#pragma once

#include <stdexcept>
#include <string>

namespace frostcoord {

enum class ErrorKind {
  kValidation = 1,
  kNotFound = 2,
  kState = 3,
  kSecurity = 4,
  kConcurrency = 5,
  kAggregation = 6,
  kExpiration = 7,
  kPublication = 8,
  kStorage = 9,
};

const char* ErrorKindName(ErrorKind kind);

// Structured failure of a coordinator operation. what() carries the
// human-readable reason; kind() tells callers whether a retry makes sense.
class CoordinatorError : public std::runtime_error {
 public:
  CoordinatorError(ErrorKind kind, const std::string& reason);

  ErrorKind kind() const;
  bool IsRetryable() const;

 private:
  ErrorKind kind_;
};

}  // namespace frostcoord
