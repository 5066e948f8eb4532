#include "replica_core/rocksdb_engine.h"

#include <rocksdb/iterator.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>

#include "basic/logger.h"
#include "error/error.h"
#include "error/rocksdb_error.h"
namespace strata::core {

static leaf::result<std::optional<std::string>> db_get(rocksdb::DB& db, const rocksdb::ReadOptions& options,
                                                       std::string_view key) {
  std::string value;
  auto s = db.Get(options, rocksdb::Slice(key.data(), key.size()), &value);
  if (s.IsNotFound()) {
    return std::optional<std::string>{};
  }
  if (!s.ok()) {
    return new_error(make_error_code(s), s.ToString());
  }
  return std::optional<std::string>{std::move(value)};
}

rocksdb_snapshot::rocksdb_snapshot(std::shared_ptr<rocksdb::DB> db)
    : db_(std::move(db)), snapshot_(db_->GetSnapshot()) {}

rocksdb_snapshot::~rocksdb_snapshot() { db_->ReleaseSnapshot(snapshot_); }

rocksdb::ReadOptions rocksdb_snapshot::read_options() const {
  rocksdb::ReadOptions options;
  options.snapshot = snapshot_;
  return options;
}

leaf::result<std::optional<std::string>> rocksdb_snapshot::get(std::string_view key) const {
  return db_get(*db_, read_options(), key);
}

leaf::result<void> rocksdb_snapshot::scan(std::string_view start, std::string_view end,
                                          const scan_visitor& visitor) const {
  std::unique_ptr<rocksdb::Iterator> iter(db_->NewIterator(read_options()));
  for (iter->Seek(rocksdb::Slice(start.data(), start.size())); iter->Valid(); iter->Next()) {
    auto key = iter->key();
    std::string_view key_view{key.data(), key.size()};
    if (!end.empty() && key_view >= end) {
      break;
    }
    auto value = iter->value();
    visitor(key_view, std::string_view{value.data(), value.size()});
  }
  auto s = iter->status();
  if (!s.ok()) {
    return new_error(make_error_code(s), s.ToString());
  }
  return {};
}

leaf::result<std::shared_ptr<rocksdb_engine>> rocksdb_engine::open(const std::string& path) {
  rocksdb::Options options;
  options.create_if_missing = true;
  rocksdb::DB* raw_db = nullptr;
  auto s = rocksdb::DB::Open(options, path, &raw_db);
  if (!s.ok()) {
    LOG_ERROR("failed to open rocksdb at {}: {}", path, s.ToString());
    return new_error(make_error_code(s), s.ToString());
  }
  return std::make_shared<rocksdb_engine>(std::shared_ptr<rocksdb::DB>(raw_db));
}

leaf::result<std::optional<std::string>> rocksdb_engine::get(std::string_view key) const {
  return db_get(*db_, rocksdb::ReadOptions{}, key);
}

engine_snapshot_proxy rocksdb_engine::new_snapshot() {
  return engine_snapshot_proxy{std::make_shared<rocksdb_snapshot>(db_)};
}

leaf::result<void> rocksdb_engine::write(engine_batch&& batch) {
  rocksdb::WriteBatch wb;
  for (const auto& w : batch.writes()) {
    switch (w.op) {
      case engine_batch::write::kind::PUT:
        wb.Put(w.key, w.value);
        break;
      case engine_batch::write::kind::DELETE:
        wb.Delete(w.key);
        break;
    }
  }
  rocksdb::WriteOptions options;
  options.sync = true;
  auto s = db_->Write(options, &wb);
  if (!s.ok()) {
    return new_error(make_error_code(s), s.ToString());
  }
  return {};
}

}  // namespace strata::core
