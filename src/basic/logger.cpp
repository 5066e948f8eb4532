#include "basic/logger.h"

#include <mutex>

#include "basic/spdlog_logger.h"

namespace strata {

namespace {
// 进程级默认 logger，首次使用时才创建 spdlog 后端
struct default_logger_slot {
  std::mutex mutex;
  std::shared_ptr<logger_interface> logger;
};

default_logger_slot& slot() {
  static default_logger_slot instance;
  return instance;
}
}  // namespace

void set_default_logger(std::shared_ptr<logger_interface> l) {
  auto& s = slot();
  std::lock_guard<std::mutex> guard(s.mutex);
  s.logger = std::move(l);
}

std::shared_ptr<logger_interface> default_logger_ptr() {
  auto& s = slot();
  std::lock_guard<std::mutex> guard(s.mutex);
  if (s.logger == nullptr) {
    s.logger = std::make_shared<spdlog_logger>();
  }
  return s.logger;
}

logger_interface& default_logger() { return *default_logger_ptr(); }

}  // namespace strata
