#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/protocol/types.hpp"
#include "frostcoord/store/sqlite_database.hpp"

namespace frostcoord {

// Federation record lookup. Verification and publication read the group key
// from here; callers never pass one in.
class GroupKeyDirectory {
 public:
  virtual ~GroupKeyDirectory() = default;

  virtual std::optional<ECPoint> FindGroupPublicKey(const GroupId& group_id) = 0;
};

class InMemoryGroupKeyDirectory : public GroupKeyDirectory {
 public:
  void RegisterGroupKey(const GroupId& group_id, const ECPoint& group_public_key);
  std::optional<ECPoint> FindGroupPublicKey(const GroupId& group_id) override;

 private:
  std::mutex mutex_;
  std::map<GroupId, ECPoint> keys_;
};

// Backed by the federation_keys table.
class SqliteGroupKeyDirectory : public GroupKeyDirectory {
 public:
  explicit SqliteGroupKeyDirectory(std::shared_ptr<SqliteDatabase> db);

  void RegisterGroupKey(const GroupId& group_id, const ECPoint& group_public_key, int64_t now_ms);
  std::optional<ECPoint> FindGroupPublicKey(const GroupId& group_id) override;

 private:
  std::shared_ptr<SqliteDatabase> db_;
};

}  // namespace frostcoord
