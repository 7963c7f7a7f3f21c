#pragma once

#include <cstdint>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/common/logging.hpp"
#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

// Runs `attempt` again while it fails with a lock conflict, up to
// `retry_limit` extra times. Each attempt must re-read and re-validate the
// session it writes. Every other error propagates on the first failure.
template <typename Attempt>
auto RetryOnConflict(uint32_t retry_limit,
                     const SessionId& session_id,
                     const char* operation,
                     Attempt&& attempt) -> decltype(attempt()) {
  for (uint32_t retries = 0;; ++retries) {
    try {
      return attempt();
    } catch (const CoordinatorError& e) {
      if (!e.IsRetryable() || retries >= retry_limit) {
        throw;
      }
      Log()->warn("{} on session {} hit a concurrent update, retry {}/{}",
                  operation,
                  ShortId(session_id),
                  retries + 1,
                  retry_limit);
    }
  }
}

}  // namespace frostcoord
