#ifndef _STRATA_ROCKSDB_ENGINE_H_
#define _STRATA_ROCKSDB_ENGINE_H_
#include <rocksdb/db.h>
#include <rocksdb/options.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "basic/utility_macros.h"
#include "error/leaf.h"
#include "replica_core/engine.h"
namespace strata::core {

// rocksdb_snapshot holds a rocksdb snapshot and releases it on destruction.
// It keeps the database alive through a shared_ptr.
class rocksdb_snapshot {
  NOT_COPYABLE_NOT_MOVABLE(rocksdb_snapshot)

 public:
  explicit rocksdb_snapshot(std::shared_ptr<rocksdb::DB> db);
  ~rocksdb_snapshot();

  leaf::result<std::optional<std::string>> get(std::string_view key) const;

  leaf::result<void> scan(std::string_view start, std::string_view end, const scan_visitor& visitor) const;

 private:
  rocksdb::ReadOptions read_options() const;

  std::shared_ptr<rocksdb::DB> db_;
  const rocksdb::Snapshot* snapshot_;
};

class rocksdb_engine {
  NOT_COPYABLE_NOT_MOVABLE(rocksdb_engine)

 public:
  // open opens (and creates if missing) the database at path.
  static leaf::result<std::shared_ptr<rocksdb_engine>> open(const std::string& path);

  explicit rocksdb_engine(std::shared_ptr<rocksdb::DB> db) : db_(std::move(db)) {}

  leaf::result<std::optional<std::string>> get(std::string_view key) const;

  engine_snapshot_proxy new_snapshot();

  leaf::result<void> write(engine_batch&& batch);

 private:
  std::shared_ptr<rocksdb::DB> db_;
};

}  // namespace strata::core

#endif  // _STRATA_ROCKSDB_ENGINE_H_
