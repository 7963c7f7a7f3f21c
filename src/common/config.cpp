#include "frostcoord/common/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>

namespace frostcoord {
namespace {

// Plain decimal in [min_value, max_value]. Anything else leaves the default
// in place.
std::optional<uint64_t> ReadBoundedEnv(const char* name, uint64_t min_value, uint64_t max_value) {
  const char* env = std::getenv(name);
  if (env == nullptr || env[0] < '0' || env[0] > '9') {
    return std::nullopt;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(env, &end, 10);
  if (errno == ERANGE || end == env || end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  if (parsed < min_value || parsed > max_value) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(parsed);
}

std::optional<std::string> ReadStringEnv(const char* name) {
  const char* env = std::getenv(name);
  if (env == nullptr || env[0] == '\0') {
    return std::nullopt;
  }
  return std::string(env);
}

}  // namespace

int64_t SystemClockMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

CoordinatorConfig CoordinatorConfig::FromEnvironment() {
  CoordinatorConfig cfg;

  constexpr uint64_t kMaxUint32 = std::numeric_limits<uint32_t>::max();
  // sqlite3_busy_timeout takes an int.
  constexpr uint64_t kMaxBusyTimeoutMs = std::numeric_limits<int>::max();

  if (const auto ttl = ReadBoundedEnv("FROSTCOORD_SESSION_TTL_SECONDS", 1, kMaxUint32)) {
    cfg.session_ttl = std::chrono::seconds(*ttl);
  }
  if (const auto days = ReadBoundedEnv("FROSTCOORD_RETENTION_DAYS", 1, kMaxUint32)) {
    cfg.retention_days = static_cast<uint32_t>(*days);
  }
  // Zero is meaningful here: surface every conflict without retrying.
  if (const auto retries = ReadBoundedEnv("FROSTCOORD_OPTIMISTIC_RETRY_LIMIT", 0, kMaxUint32)) {
    cfg.optimistic_retry_limit = static_cast<uint32_t>(*retries);
  }
  if (const auto path = ReadStringEnv("FROSTCOORD_DB_PATH")) {
    cfg.db_path = *path;
  }
  if (const auto busy = ReadBoundedEnv("FROSTCOORD_SQLITE_BUSY_TIMEOUT_MS", 1, kMaxBusyTimeoutMs)) {
    cfg.sqlite_busy_timeout = std::chrono::milliseconds(*busy);
  }
  if (const auto level = ReadStringEnv("FROSTCOORD_LOG_LEVEL")) {
    cfg.log_level = *level;
  }
  return cfg;
}

}  // namespace frostcoord
