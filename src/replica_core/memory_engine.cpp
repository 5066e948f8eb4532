#include "replica_core/memory_engine.h"

#include "error/error.h"
#include "error/storage_error.h"
namespace strata::core {

static leaf::result<std::optional<std::string>> map_get(const memory_kv_map& data, std::string_view key) {
  auto iter = data.find(key);
  if (iter == data.end()) {
    return std::optional<std::string>{};
  }
  return std::optional<std::string>{iter->second};
}

static leaf::result<void> map_scan(const memory_kv_map& data, std::string_view start, std::string_view end,
                                   const scan_visitor& visitor) {
  for (auto iter = data.lower_bound(start); iter != data.end(); ++iter) {
    if (!end.empty() && std::string_view{iter->first} >= end) {
      break;
    }
    visitor(iter->first, iter->second);
  }
  return {};
}

leaf::result<std::optional<std::string>> memory_snapshot::get(std::string_view key) const {
  return map_get(*data_, key);
}

leaf::result<void> memory_snapshot::scan(std::string_view start, std::string_view end,
                                         const scan_visitor& visitor) const {
  return map_scan(*data_, start, end, visitor);
}

std::shared_ptr<const memory_kv_map> memory_engine::current() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return data_;
}

leaf::result<std::optional<std::string>> memory_engine::get(std::string_view key) const {
  return map_get(*current(), key);
}

leaf::result<void> memory_engine::scan(std::string_view start, std::string_view end,
                                       const scan_visitor& visitor) const {
  return map_scan(*current(), start, end, visitor);
}

engine_snapshot_proxy memory_engine::new_snapshot() {
  return pro::make_proxy<engine_snapshot_builder, memory_snapshot>(current());
}

leaf::result<void> memory_engine::write(engine_batch&& batch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (fail_writes_) {
    return new_error(storage_error::WRITE_FAILED, "memory engine: injected write failure");
  }
  auto next = std::make_shared<memory_kv_map>(*data_);
  for (const auto& w : batch.writes()) {
    switch (w.op) {
      case engine_batch::write::kind::PUT:
        (*next)[w.key] = w.value;
        break;
      case engine_batch::write::kind::DELETE:
        next->erase(w.key);
        break;
    }
  }
  data_ = std::move(next);
  ++write_count_;
  return {};
}

std::size_t memory_engine::size() const { return current()->size(); }

}  // namespace strata::core
