#ifndef _STRATA_MEMORY_ENGINE_H_
#define _STRATA_MEMORY_ENGINE_H_
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "basic/utility_macros.h"
#include "error/leaf.h"
#include "replica_core/engine.h"
namespace strata::core {

using memory_kv_map = std::map<std::string, std::string, std::less<>>;

// memory_snapshot pins one immutable version of the memory engine's map.
class memory_snapshot {
 public:
  explicit memory_snapshot(std::shared_ptr<const memory_kv_map> data) : data_(std::move(data)) {}

  leaf::result<std::optional<std::string>> get(std::string_view key) const;

  leaf::result<void> scan(std::string_view start, std::string_view end, const scan_visitor& visitor) const;

 private:
  std::shared_ptr<const memory_kv_map> data_;
};

// memory_engine keeps everything in an ordered map. Every write installs a
// new copy of the map, so a snapshot is just a reference to the current one.
class memory_engine {
  NOT_COPYABLE_NOT_MOVABLE(memory_engine)

 public:
  memory_engine() : data_(std::make_shared<const memory_kv_map>()) {}

  leaf::result<std::optional<std::string>> get(std::string_view key) const;

  leaf::result<void> scan(std::string_view start, std::string_view end, const scan_visitor& visitor) const;

  engine_snapshot_proxy new_snapshot();

  leaf::result<void> write(engine_batch&& batch);

  std::size_t size() const;

#ifdef STRATA_TEST
  // fail_writes makes every following write fail with storage_error::WRITE_FAILED.
  void fail_writes(bool fail) {
    std::lock_guard<std::mutex> guard(mutex_);
    fail_writes_ = fail;
  }

  std::size_t write_count() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return write_count_;
  }
#endif

 private:
  std::shared_ptr<const memory_kv_map> current() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const memory_kv_map> data_;
  bool fail_writes_ = false;
  std::size_t write_count_ = 0;
};

}  // namespace strata::core

#endif  // _STRATA_MEMORY_ENGINE_H_
