#ifndef _STRATA_HLC_CLOCK_H_
#define _STRATA_HLC_CLOCK_H_
#include <replica.pb.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "basic/utility_macros.h"
namespace strata::core {

// hlc_clock is a hybrid logical clock. Readings never go backwards even if
// the physical source does; ties on the wall time are broken by the logical
// counter.
class hlc_clock {
  NOT_COPYABLE_NOT_MOVABLE(hlc_clock)

 public:
  // physical_clock returns nanoseconds since the unix epoch.
  using physical_clock = std::function<std::int64_t()>;

  static std::int64_t unix_nanos();

  explicit hlc_clock(physical_clock physical = unix_nanos) : physical_(std::move(physical)) {}

  replicapb::timestamp now();

  // physical_now reads the physical source without touching the logical state.
  std::int64_t physical_now() const { return physical_(); }

  std::chrono::system_clock::time_point physical_time() const;

  // update ratchets the clock forward to a timestamp received from a peer.
  void update(const replicapb::timestamp& remote);

 private:
  physical_clock physical_;
  std::mutex mutex_;
  std::int64_t wall_time_ = 0;
  std::int32_t logical_ = 0;
};

// manual_clock is a physical source which only moves when told to.
class manual_clock {
 public:
  explicit manual_clock(std::int64_t nanos) : nanos_(nanos) {}

  std::int64_t unix_nanos() const { return nanos_.load(); }

  void increment(std::int64_t nanos) { nanos_.fetch_add(nanos); }

  void set(std::int64_t nanos) { nanos_.store(nanos); }

 private:
  std::atomic<std::int64_t> nanos_;
};

}  // namespace strata::core

#endif  // _STRATA_HLC_CLOCK_H_
