#ifndef _STRATA_APPLY_SCHEDULER_H_
#define _STRATA_APPLY_SCHEDULER_H_
#include <absl/container/flat_hash_map.h>
#include <replica.pb.h>

#include <asio/any_io_executor.hpp>
#include <asio/strand.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "basic/logger.h"
#include "basic/utility_macros.h"
#include "error/leaf.h"
#include "replica_core/engine.h"
#include "replica_core/eval_result.h"
#include "replica_core/pb/types.h"
#include "replica_core/replica.h"
namespace strata::core {

// apply_scheduler runs committed commands against their replicas. Commands
// of one range run one after another in the order they were scheduled;
// different ranges run in parallel on the executor.
//
// A fatal error halts the range: the remaining and future commands of that
// range are refused, other ranges carry on.
class apply_scheduler {
  NOT_COPYABLE_NOT_MOVABLE(apply_scheduler)

 public:
  explicit apply_scheduler(asio::any_io_executor executor,
                           std::shared_ptr<strata::logger_interface> logger = strata::default_logger_ptr())
      : executor_(std::move(executor)), logger_(std::move(logger)) {}

  leaf::result<void> add_replica(std::shared_ptr<replica> r);

  leaf::result<void> remove_replica(pb::range_id range_id);

  leaf::result<void> schedule(pb::range_id range_id, const replicapb::replica_descriptor& origin,
                              eval_result&& result, engine_batch&& batch);

  bool halted(pb::range_id range_id) const;

  // applied returns the number of commands the range applied successfully.
  std::uint64_t applied(pb::range_id range_id) const;

 private:
  struct range_worker {
    range_worker(std::shared_ptr<replica> r, asio::any_io_executor executor)
        : rep(std::move(r)), strand(asio::make_strand(executor)) {}

    std::shared_ptr<replica> rep;
    asio::strand<asio::any_io_executor> strand;
    std::atomic<bool> halted{false};
    std::atomic<std::uint64_t> applied{0};
  };

  std::shared_ptr<range_worker> find(pb::range_id range_id) const;

  // run executes on the range's strand. It only touches the worker and the
  // logger it is handed, never the scheduler, which may already be gone.
  static void run(strata::logger_interface& logger, range_worker& worker,
                  const replicapb::replica_descriptor& origin, eval_result&& result, engine_batch&& batch);

  asio::any_io_executor executor_;
  std::shared_ptr<strata::logger_interface> logger_;
  mutable std::mutex mutex_;
  absl::flat_hash_map<pb::range_id, std::shared_ptr<range_worker>> workers_;
};

}  // namespace strata::core

#endif  // _STRATA_APPLY_SCHEDULER_H_
