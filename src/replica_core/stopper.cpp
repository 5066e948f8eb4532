#include "replica_core/stopper.h"

#include <asio/post.hpp>
#include <fmt/format.h>

#include "error/error.h"
#include "error/replica_error.h"
namespace strata::core {

leaf::result<void> stopper::run_async_task(std::string_view name, std::function<void()> task) {
  if (quiescing()) {
    LOGGER_DEBUG(logger_, "refusing async task {}: stopper is quiescing", name);
    return new_error(replica_error::STOPPER_QUIESCING, fmt::format("cannot run task {}", name));
  }
  running_->fetch_add(1);
  asio::post(executor_, [task = std::move(task), running = running_]() {
    task();
    running->fetch_sub(1);
  });
  return {};
}

}  // namespace strata::core
