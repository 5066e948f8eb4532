#pragma once
#ifndef _STRATA_SPDLOG_LOGGER_H_
#define _STRATA_SPDLOG_LOGGER_H_
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

#include "basic/logger.h"
namespace strata {

// spdlog_logger forwards to a spdlog logger, the process default one unless
// another is given. log_level values map 1:1 onto spdlog::level::level_enum.
class spdlog_logger : public logger_interface {
 public:
  spdlog_logger() = default;
  explicit spdlog_logger(std::shared_ptr<spdlog::logger> sink) : sink_(std::move(sink)) {}

  bool should_log(log_level level) const override {
    return target()->should_log(static_cast<spdlog::level::level_enum>(level));
  }

  void log_impl(log_level level, std::string_view msg, std::source_location loc) override {
    target()->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                  static_cast<spdlog::level::level_enum>(level), "[{}:{}] {}", loc.file_name(), loc.line(), msg);
  }

 private:
  spdlog::logger* target() const { return sink_ ? sink_.get() : spdlog::default_logger_raw(); }

  std::shared_ptr<spdlog::logger> sink_;
};

}  // namespace strata

#endif  // _STRATA_SPDLOG_LOGGER_H_
