#ifndef _STRATA_TIMESTAMP_CACHE_H_
#define _STRATA_TIMESTAMP_CACHE_H_
#include <absl/container/flat_hash_map.h>
#include <replica.pb.h>

#include <string>
#include <string_view>

namespace strata::core {

// timestamp_cache remembers the latest timestamp at which each key was read,
// so that a later write below that timestamp can be pushed above it. Keys that
// are not tracked report the low water mark.
//
// Not thread safe, the owning replica guards it with its mutex.
class timestamp_cache {
 public:
  timestamp_cache() = default;

  // add records a read of key at ts. Reads at or below the low water mark are
  // not tracked.
  void add(std::string_view key, const replicapb::timestamp& ts);

  // get_max returns the latest read timestamp of key.
  replicapb::timestamp get_max(std::string_view key) const;

  // set_low_water ratchets the low water mark forward. Entries that fall at or
  // below it are dropped.
  void set_low_water(const replicapb::timestamp& ts);

  // clear drops every entry and resets the low water mark to ts.
  void clear(const replicapb::timestamp& ts);

  const replicapb::timestamp& low_water() const { return low_water_; }

  std::size_t size() const { return entries_.size(); }

 private:
  replicapb::timestamp low_water_;
  absl::flat_hash_map<std::string, replicapb::timestamp> entries_;
};

}  // namespace strata::core

#endif  // _STRATA_TIMESTAMP_CACHE_H_
