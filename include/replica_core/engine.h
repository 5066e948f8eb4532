#ifndef _STRATA_ENGINE_H_
#define _STRATA_ENGINE_H_
#include <google/protobuf/message.h>
#include <proxy.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "basic/utility_macros.h"
#include "error/leaf.h"
namespace strata::core {

// engine_batch collects the writes of one applied command. The engine commits
// a batch atomically or not at all.
class engine_batch {
 public:
  struct write {
    enum class kind { PUT, DELETE };
    kind op;
    std::string key;
    std::string value;
  };

  engine_batch() = default;
  MOVABLE_BUT_NOT_COPYABLE(engine_batch)

  void put(std::string key, std::string value) {
    writes_.push_back(write{write::kind::PUT, std::move(key), std::move(value)});
  }

  void put_message(std::string key, const google::protobuf::Message& msg) {
    writes_.push_back(write{write::kind::PUT, std::move(key), msg.SerializeAsString()});
  }

  void del(std::string key) { writes_.push_back(write{write::kind::DELETE, std::move(key), {}}); }

  const std::vector<write>& writes() const { return writes_; }

  bool empty() const { return writes_.empty(); }

  std::size_t count() const { return writes_.size(); }

 private:
  std::vector<write> writes_;
};

// scan_visitor receives every key/value of a scan in ascending key order.
using scan_visitor = std::function<void(std::string_view key, std::string_view value)>;

PRO_DEF_MEM_DISPATCH(engine_get, get);

// Scan visits every key in [start, end). An empty end means "to the end of
// the keyspace".
PRO_DEF_MEM_DISPATCH(engine_scan, scan);

// NewSnapshot returns a consistent point-in-time view of the engine. Writes
// committed afterwards are invisible to it.
PRO_DEF_MEM_DISPATCH(engine_new_snapshot, new_snapshot);

// Write commits a batch atomically.
PRO_DEF_MEM_DISPATCH(engine_write, write);

// clang-format off
struct engine_snapshot_builder : pro::facade_builder
  ::add_convention<engine_get, leaf::result<std::optional<std::string>>(std::string_view key) const>
  ::add_convention<engine_scan, leaf::result<void>(std::string_view start, std::string_view end, const scan_visitor& visitor) const>
  ::build{};

struct engine_builder : pro::facade_builder
  ::add_convention<engine_get, leaf::result<std::optional<std::string>>(std::string_view key) const>
  ::add_convention<engine_new_snapshot, pro::proxy<engine_snapshot_builder>()>
  ::add_convention<engine_write, leaf::result<void>(engine_batch&& batch)>
  ::build{};
// clang-format on

using engine_snapshot_proxy = pro::proxy<engine_snapshot_builder>;
using engine_proxy = pro::proxy<engine_builder>;

}  // namespace strata::core

#endif  // _STRATA_ENGINE_H_
