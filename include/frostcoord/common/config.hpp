#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace frostcoord {

// Epoch milliseconds. Injected so tests can drive expiry deterministically.
using Clock = std::function<int64_t()>;

int64_t SystemClockMillis();

struct CoordinatorConfig {
  std::chrono::seconds session_ttl = std::chrono::seconds(600);
  uint32_t retention_days = 90;
  uint32_t optimistic_retry_limit = 3;
  std::string db_path = "frostcoord.db";
  std::chrono::milliseconds sqlite_busy_timeout = std::chrono::milliseconds(5000);
  std::string log_level = "info";

  static CoordinatorConfig FromEnvironment();
};

}  // namespace frostcoord
