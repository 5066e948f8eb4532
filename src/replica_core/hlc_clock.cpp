#include "replica_core/hlc_clock.h"

#include "basic/time.h"

namespace strata::core {

std::int64_t hlc_clock::unix_nanos() { return to_nanos(std::chrono::system_clock::now()); }

replicapb::timestamp hlc_clock::now() {
  const auto physical = physical_();
  std::lock_guard<std::mutex> guard(mutex_);
  if (wall_time_ >= physical) {
    logical_++;
  } else {
    wall_time_ = physical;
    logical_ = 0;
  }
  replicapb::timestamp ts;
  ts.set_wall_time(wall_time_);
  ts.set_logical(logical_);
  return ts;
}

std::chrono::system_clock::time_point hlc_clock::physical_time() const { return from_nanos(physical_()); }

void hlc_clock::update(const replicapb::timestamp& remote) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (remote.wall_time() > wall_time_) {
    wall_time_ = remote.wall_time();
    logical_ = remote.logical();
  } else if (remote.wall_time() == wall_time_ && remote.logical() > logical_) {
    logical_ = remote.logical();
  }
}

}  // namespace strata::core
