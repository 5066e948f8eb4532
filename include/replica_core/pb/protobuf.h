#ifndef _STRATA_PB_PROTOBUF_H_
#define _STRATA_PB_PROTOBUF_H_
#include <google/protobuf/message.h>
#include <replica.pb.h>

#include <string>

#include "replica_core/pb/types.h"
namespace strata::core {
namespace pb {

// ---- timestamp ----
bool is_empty(const replicapb::timestamp& ts);

bool less(const replicapb::timestamp& lhs, const replicapb::timestamp& rhs);

bool equal(const replicapb::timestamp& lhs, const replicapb::timestamp& rhs);

// forward ratchets ts up to other. Returns true if ts was updated.
bool forward(replicapb::timestamp& ts, const replicapb::timestamp& other);

std::string to_string(const replicapb::timestamp& ts);

// ---- mvcc_stats ----
bool is_empty(const replicapb::mvcc_stats& ms);

// add folds delta into ms. Counters add up, contains_estimates is sticky and
// last_update_nanos takes the later of both.
void add(replicapb::mvcc_stats& ms, const replicapb::mvcc_stats& delta);

// total is the number of bytes the split-by-size check looks at.
std::int64_t total(const replicapb::mvcc_stats& ms);

// ---- lease ----
// covers reports whether the lease is valid for reads at ts, that is
// start <= ts < start_stasis. Leases without a stasis period end at
// expiration.
bool covers(const replicapb::lease& l, const replicapb::timestamp& ts);

std::string describe(const replicapb::lease& l);

// ---- range_descriptor ----
std::string describe(const replicapb::range_descriptor& desc);

// ---- generic ----
bool is_zero(const google::protobuf::Message& msg);

bool equal(const google::protobuf::Message& lhs, const google::protobuf::Message& rhs);

// diff renders the differences between lhs and rhs, empty when equal.
std::string diff(const google::protobuf::Message& lhs, const google::protobuf::Message& rhs);

}  // namespace pb
}  // namespace strata::core

#endif  // _STRATA_PB_PROTOBUF_H_
