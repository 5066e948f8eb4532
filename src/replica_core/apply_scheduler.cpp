#include "replica_core/apply_scheduler.h"

#include <asio/post.hpp>
#include <fmt/format.h>

#include "error/error.h"
#include "error/logic_error.h"
#include "error/replica_error.h"
namespace strata::core {

leaf::result<void> apply_scheduler::add_replica(std::shared_ptr<replica> r) {
  if (r == nullptr) {
    return new_error(logic_error::NULL_POINTER, "replica cannot be null");
  }
  auto range_id = r->range_id();
  std::lock_guard<std::mutex> guard(mutex_);
  if (workers_.contains(range_id)) {
    return new_error(logic_error::KEY_EXISTS, fmt::format("range {} already has a replica", range_id));
  }
  workers_.emplace(range_id, std::make_shared<range_worker>(std::move(r), executor_));
  return {};
}

leaf::result<void> apply_scheduler::remove_replica(pb::range_id range_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (workers_.erase(range_id) == 0) {
    return new_error(logic_error::KEY_NOT_FOUND, fmt::format("range {} not found", range_id));
  }
  return {};
}

std::shared_ptr<apply_scheduler::range_worker> apply_scheduler::find(pb::range_id range_id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto iter = workers_.find(range_id);
  if (iter == workers_.end()) {
    return nullptr;
  }
  return iter->second;
}

leaf::result<void> apply_scheduler::schedule(pb::range_id range_id, const replicapb::replica_descriptor& origin,
                                             eval_result&& result, engine_batch&& batch) {
  auto worker = find(range_id);
  if (worker == nullptr) {
    return new_error(logic_error::KEY_NOT_FOUND, fmt::format("range {} not found", range_id));
  }
  if (worker->halted.load()) {
    return new_error(replica_error::REPLICA_HALTED, fmt::format("range {} halted", range_id));
  }
  asio::post(worker->strand,
             [logger = logger_, worker, origin, result = std::move(result), batch = std::move(batch)]() mutable {
               run(*logger, *worker, origin, std::move(result), std::move(batch));
             });
  return {};
}

void apply_scheduler::run(strata::logger_interface& logger, range_worker& worker,
                          const replicapb::replica_descriptor& origin, eval_result&& result, engine_batch&& batch) {
  // apply_command refuses the command and notifies the proposer once the
  // replica halted.
  leaf::try_handle_all(
      [&]() -> leaf::result<void> {
        BOOST_LEAF_CHECK(worker.rep->apply_command(origin, std::move(result), std::move(batch)));
        worker.applied.fetch_add(1);
        return {};
      },
      [&](const strata_error& err) {
        if (is_fatal(err.err_code)) {
          if (!worker.halted.exchange(true)) {
            LOGGER_CRITICAL(logger, "range {} stopped applying commands: {}", worker.rep->range_id(), err.what());
          }
          return;
        }
        LOGGER_WARN(logger, "range {} failed to apply command: {}", worker.rep->range_id(), err.what());
      },
      [&](const leaf::error_info& info) {
        LOGGER_ERROR(logger, "range {} failed to apply command with unexpected error {}", worker.rep->range_id(),
                     info.error().value());
      });
}

bool apply_scheduler::halted(pb::range_id range_id) const {
  auto worker = find(range_id);
  if (worker == nullptr) {
    return false;
  }
  return worker->halted.load() || worker->rep->halted();
}

std::uint64_t apply_scheduler::applied(pb::range_id range_id) const {
  auto worker = find(range_id);
  if (worker == nullptr) {
    return 0;
  }
  return worker->applied.load();
}

}  // namespace strata::core
