#include "frostcoord/store/sqlite_backend.hpp"

#include "frostcoord/common/logging.hpp"

namespace frostcoord {

SqliteBackend SqliteBackend::Open(const CoordinatorConfig& config) {
  SqliteBackend backend;
  backend.db = std::make_shared<SqliteDatabase>(config.db_path, config.sqlite_busy_timeout);
  backend.sessions = std::make_shared<SqliteSessionStore>(backend.db);
  backend.group_keys = std::make_shared<SqliteGroupKeyDirectory>(backend.db);
  backend.approvals = std::make_shared<SqliteApprovalAuditService>(backend.db);
  Log()->info("opened session database {}", config.db_path);
  return backend;
}

}  // namespace frostcoord
