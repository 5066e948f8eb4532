#ifndef _STRATA_PB_TYPES_H_
#define _STRATA_PB_TYPES_H_
#include <google/protobuf/repeated_field.h>
#include <replica.pb.h>

#include <cstdint>
#include <string>
#include <vector>

namespace strata::core {
namespace pb {
using range_id = std::uint64_t;
using store_id = std::uint64_t;
using node_id = std::uint64_t;
using replica_id = std::uint64_t;

using repeated_log_entry = google::protobuf::RepeatedPtrField<replicapb::log_entry>;
using repeated_replica_descriptor = google::protobuf::RepeatedPtrField<replicapb::replica_descriptor>;

// intent is a provisional write of a transaction found during evaluation and
// left for asynchronous resolution.
struct intent {
  std::string key;
  std::string txn_id;

  auto operator<=>(const intent&) const = default;
};

// intents_with_arg groups the intents encountered by one request of a batch.
struct intents_with_arg {
  std::string request_key;
  std::vector<intent> intents;

  auto operator<=>(const intents_with_arg&) const = default;
};

// None is a placeholder replica ID used when there is no replica.
constexpr std::uint64_t NONE = 0;
}  // namespace pb
}  // namespace strata::core

#endif  // _STRATA_PB_TYPES_H_
