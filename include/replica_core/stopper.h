#ifndef _STRATA_STOPPER_H_
#define _STRATA_STOPPER_H_
#include <asio/any_io_executor.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "basic/logger.h"
#include "basic/utility_macros.h"
#include "error/leaf.h"
namespace strata::core {

// stopper launches fire-and-forget tasks on an executor. Once quiesce() has
// been called no new task is accepted; callers must then fall back to
// completing inline whatever the task would have completed.
class stopper {
  NOT_COPYABLE_NOT_MOVABLE(stopper)

 public:
  explicit stopper(asio::any_io_executor executor,
                   std::shared_ptr<strata::logger_interface> logger = strata::default_logger_ptr())
      : executor_(std::move(executor)), logger_(std::move(logger)) {}

  leaf::result<void> run_async_task(std::string_view name, std::function<void()> task);

  void quiesce() { quiescing_.store(true); }

  bool quiescing() const { return quiescing_.load(); }

  std::size_t running_tasks() const { return running_->load(); }

  const asio::any_io_executor& executor() const { return executor_; }

 private:
  asio::any_io_executor executor_;
  std::shared_ptr<strata::logger_interface> logger_;
  std::atomic<bool> quiescing_{false};
  // shared with the posted tasks, which may outlive a stopped stopper.
  std::shared_ptr<std::atomic<std::size_t>> running_ = std::make_shared<std::atomic<std::size_t>>(0);
};

}  // namespace strata::core

#endif  // _STRATA_STOPPER_H_
