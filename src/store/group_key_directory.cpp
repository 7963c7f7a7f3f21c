#include "frostcoord/store/group_key_directory.hpp"

#include <stdexcept>

#include "frostcoord/crypto/encoding.hpp"

namespace frostcoord {

void InMemoryGroupKeyDirectory::RegisterGroupKey(const GroupId& group_id, const ECPoint& group_public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.insert_or_assign(group_id, group_public_key);
}

std::optional<ECPoint> InMemoryGroupKeyDirectory::FindGroupPublicKey(const GroupId& group_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = keys_.find(group_id);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

SqliteGroupKeyDirectory::SqliteGroupKeyDirectory(std::shared_ptr<SqliteDatabase> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("SqliteGroupKeyDirectory requires a database");
  }
  db_->Execute(
      "CREATE TABLE IF NOT EXISTS federation_keys ("
      "  group_id TEXT PRIMARY KEY,"
      "  group_public_key TEXT NOT NULL CHECK (length(group_public_key) = 66),"
      "  updated_at INTEGER NOT NULL"
      ");");
}

void SqliteGroupKeyDirectory::RegisterGroupKey(const GroupId& group_id,
                                               const ECPoint& group_public_key,
                                               int64_t now_ms) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto upsert = db_->Prepare(
      "INSERT INTO federation_keys (group_id, group_public_key, updated_at) VALUES (?1, ?2, ?3) "
      "ON CONFLICT (group_id) DO UPDATE SET group_public_key = excluded.group_public_key, "
      "updated_at = excluded.updated_at");
  upsert.Bind(1, group_id).Bind(2, EncodePointHex(group_public_key)).Bind(3, now_ms);
  upsert.Run();
}

std::optional<ECPoint> SqliteGroupKeyDirectory::FindGroupPublicKey(const GroupId& group_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  auto select = db_->Prepare("SELECT group_public_key FROM federation_keys WHERE group_id = ?1");
  select.Bind(1, group_id);
  if (!select.Step()) {
    return std::nullopt;
  }
  return DecodePointHex(select.ColumnText(0));
}

}  // namespace frostcoord
