#include "replica_core/pb/protobuf.h"

#include <fmt/format.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>

namespace strata::core {
namespace pb {

bool is_empty(const replicapb::timestamp& ts) { return ts.wall_time() == 0 && ts.logical() == 0; }

bool less(const replicapb::timestamp& lhs, const replicapb::timestamp& rhs) {
  return lhs.wall_time() < rhs.wall_time() || (lhs.wall_time() == rhs.wall_time() && lhs.logical() < rhs.logical());
}

bool equal(const replicapb::timestamp& lhs, const replicapb::timestamp& rhs) {
  return lhs.wall_time() == rhs.wall_time() && lhs.logical() == rhs.logical();
}

bool forward(replicapb::timestamp& ts, const replicapb::timestamp& other) {
  if (less(ts, other)) {
    ts.CopyFrom(other);
    return true;
  }
  return false;
}

std::string to_string(const replicapb::timestamp& ts) {
  return fmt::format("{}.{:09d},{}", ts.wall_time() / 1000000000, ts.wall_time() % 1000000000, ts.logical());
}

bool is_empty(const replicapb::mvcc_stats& ms) { return ms.ByteSizeLong() == 0; }

void add(replicapb::mvcc_stats& ms, const replicapb::mvcc_stats& delta) {
  ms.set_contains_estimates(ms.contains_estimates() || delta.contains_estimates());
  ms.set_last_update_nanos(std::max(ms.last_update_nanos(), delta.last_update_nanos()));
  ms.set_intent_age(ms.intent_age() + delta.intent_age());
  ms.set_gc_bytes_age(ms.gc_bytes_age() + delta.gc_bytes_age());
  ms.set_live_bytes(ms.live_bytes() + delta.live_bytes());
  ms.set_live_count(ms.live_count() + delta.live_count());
  ms.set_key_bytes(ms.key_bytes() + delta.key_bytes());
  ms.set_key_count(ms.key_count() + delta.key_count());
  ms.set_val_bytes(ms.val_bytes() + delta.val_bytes());
  ms.set_val_count(ms.val_count() + delta.val_count());
  ms.set_intent_bytes(ms.intent_bytes() + delta.intent_bytes());
  ms.set_intent_count(ms.intent_count() + delta.intent_count());
  ms.set_sys_bytes(ms.sys_bytes() + delta.sys_bytes());
  ms.set_sys_count(ms.sys_count() + delta.sys_count());
}

std::int64_t total(const replicapb::mvcc_stats& ms) { return ms.key_bytes() + ms.val_bytes(); }

bool covers(const replicapb::lease& l, const replicapb::timestamp& ts) {
  if (less(ts, l.start())) {
    return false;
  }
  const auto& end = is_empty(l.start_stasis()) ? l.expiration() : l.start_stasis();
  return less(ts, end);
}

std::string describe(const replicapb::lease& l) {
  return fmt::format("repl=(n{},s{}):{} start={} exp={}", l.replica().node_id(), l.replica().store_id(),
                     l.replica().replica_id(), to_string(l.start()), to_string(l.expiration()));
}

std::string describe(const replicapb::range_descriptor& desc) {
  std::string replicas;
  for (const auto& r : desc.replicas()) {
    if (!replicas.empty()) {
      replicas += ",";
    }
    replicas += fmt::format("(n{},s{}):{}", r.node_id(), r.store_id(), r.replica_id());
  }
  return fmt::format("r{}:[{:?}, {:?}) [{}, next={}]", desc.range_id(), desc.start_key(), desc.end_key(), replicas,
                     desc.next_replica_id());
}

bool is_zero(const google::protobuf::Message& msg) { return msg.ByteSizeLong() == 0; }

bool equal(const google::protobuf::Message& lhs, const google::protobuf::Message& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

std::string diff(const google::protobuf::Message& lhs, const google::protobuf::Message& rhs) {
  std::string report;
  google::protobuf::util::MessageDifferencer differencer;
  differencer.ReportDifferencesToString(&report);
  if (differencer.Compare(lhs, rhs)) {
    return {};
  }
  return report;
}

}  // namespace pb
}  // namespace strata::core
