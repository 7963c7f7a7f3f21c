#pragma once

#include <memory>

#include "frostcoord/common/config.hpp"
#include "frostcoord/store/approval_audit_store.hpp"
#include "frostcoord/store/group_key_directory.hpp"
#include "frostcoord/store/sqlite_database.hpp"
#include "frostcoord/store/sqlite_session_store.hpp"

namespace frostcoord {

// Every SQLite-backed service over one connection to config.db_path.
struct SqliteBackend {
  std::shared_ptr<SqliteDatabase> db;
  std::shared_ptr<SqliteSessionStore> sessions;
  std::shared_ptr<SqliteGroupKeyDirectory> group_keys;
  std::shared_ptr<SqliteApprovalAuditService> approvals;

  static SqliteBackend Open(const CoordinatorConfig& config);
};

}  // namespace frostcoord
