#ifndef _STRATA_KEYS_H_
#define _STRATA_KEYS_H_
#include <cstdint>
#include <string>
#include <string_view>

namespace strata::core::keys {

// Every key starting with LOCAL_PREFIX is node-local bookkeeping; user data
// never uses that byte. Range-id-local replicated state lives under
// LOCAL_RANGE_ID_PREFIX followed by the big-endian range id and a suffix.
inline constexpr std::string_view LOCAL_PREFIX = "\x01";
inline constexpr std::string_view LOCAL_RANGE_ID_PREFIX = "\x01i";
// LOCAL_MAX is the first key of the user keyspace.
inline constexpr std::string_view LOCAL_MAX = "\x02";

inline constexpr std::string_view RAFT_APPLIED_INDEX_SUFFIX = "rfta";
inline constexpr std::string_view LEASE_APPLIED_INDEX_SUFFIX = "rlla";
inline constexpr std::string_view RANGE_DESCRIPTOR_SUFFIX = "rdsc";
inline constexpr std::string_view RANGE_LEASE_SUFFIX = "rll-";
inline constexpr std::string_view RAFT_TRUNCATED_STATE_SUFFIX = "rftt";
inline constexpr std::string_view RANGE_GC_THRESHOLD_SUFFIX = "lgc-";
inline constexpr std::string_view RANGE_TXN_SPAN_GC_THRESHOLD_SUFFIX = "tst-";
inline constexpr std::string_view RANGE_STATS_SUFFIX = "stat";
inline constexpr std::string_view RANGE_FROZEN_STATUS_SUFFIX = "fzn-";

std::string make_range_id_prefix(std::uint64_t range_id);

std::string raft_applied_index_key(std::uint64_t range_id);
std::string lease_applied_index_key(std::uint64_t range_id);
std::string range_descriptor_key(std::uint64_t range_id);
std::string range_lease_key(std::uint64_t range_id);
std::string raft_truncated_state_key(std::uint64_t range_id);
std::string range_gc_threshold_key(std::uint64_t range_id);
std::string range_txn_span_gc_threshold_key(std::uint64_t range_id);
std::string range_stats_key(std::uint64_t range_id);
std::string range_frozen_status_key(std::uint64_t range_id);

// prefix_end returns the smallest key greater than every key with the given
// prefix. An all-0xff prefix has no end and yields the empty string.
std::string prefix_end(std::string_view prefix);

bool is_local(std::string_view key);

}  // namespace strata::core::keys

#endif  // _STRATA_KEYS_H_
