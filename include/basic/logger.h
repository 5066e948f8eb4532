#pragma once
#ifndef _STRATA_LOGGER_H_
#define _STRATA_LOGGER_H_
#include <fmt/core.h>

#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

enum class log_level {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6,
};

class logger_interface {
 public:
  virtual ~logger_interface() = default;

  virtual bool should_log(log_level level) const = 0;

  virtual void log_impl(log_level level, std::string_view msg, std::source_location loc) = 0;

  void trace_impl(std::string_view msg, std::source_location loc) { log_impl(log_level::trace, msg, loc); }
  void debug_impl(std::string_view msg, std::source_location loc) { log_impl(log_level::debug, msg, loc); }
  void info_impl(std::string_view msg, std::source_location loc) { log_impl(log_level::info, msg, loc); }
  void warn_impl(std::string_view msg, std::source_location loc) { log_impl(log_level::warn, msg, loc); }
  void error_impl(std::string_view msg, std::source_location loc) { log_impl(log_level::error, msg, loc); }
  void critical_impl(std::string_view msg, std::source_location loc) { log_impl(log_level::critical, msg, loc); }
};

// tagged_logger prefixes every message with a fixed tag, e.g. "[s1,r7]" for
// store 1 and range 7, and forwards to another logger.
class tagged_logger : public logger_interface {
 public:
  tagged_logger(std::shared_ptr<logger_interface> inner, std::string tag)
      : inner_(std::move(inner)), tag_(std::move(tag)) {}

  bool should_log(log_level level) const override { return inner_->should_log(level); }

  void log_impl(log_level level, std::string_view msg, std::source_location loc) override {
    inner_->log_impl(level, fmt::format("{} {}", tag_, msg), loc);
  }

  const std::string& tag() const { return tag_; }

 private:
  std::shared_ptr<logger_interface> inner_;
  std::string tag_;
};

// ----------------------
// 宏 + 模板包装函数
// ----------------------
#define STRATA_DEFINE_LOG_FUNC(level)                                                                      \
  template <typename Logger, typename... Args>                                                             \
  inline void log_##level(Logger& l, std::source_location loc, fmt::format_string<Args...> fmt_str,          \
                          Args&&... args) {                                                                \
    l.level##_impl(fmt::format(fmt_str, std::forward<Args>(args)...), loc);                                \
  }                                                                                                        \
  inline void log_##level(logger_interface& l, std::source_location loc, std::string_view msg) { \
    l.level##_impl(msg, loc);                                                                              \
  }

STRATA_DEFINE_LOG_FUNC(trace)
STRATA_DEFINE_LOG_FUNC(debug)
STRATA_DEFINE_LOG_FUNC(info)
STRATA_DEFINE_LOG_FUNC(warn)
STRATA_DEFINE_LOG_FUNC(error)
STRATA_DEFINE_LOG_FUNC(critical)

#undef STRATA_DEFINE_LOG_FUNC

template <typename T>
logger_interface& get_logger_ref(T& l) {
  return l;
}

template <typename T>
logger_interface& get_logger_ref(std::unique_ptr<T>& l) {
  return *l;
}

template <typename T>
logger_interface& get_logger_ref(std::shared_ptr<T>& l) {
  return *l;
}

template <typename T>
logger_interface& get_logger_ref(const std::shared_ptr<T>& l) {
  return *l;
}

#define LOGGER_CALL(logger_obj, level, ...)                               \
  do {                                                                    \
    auto& _logger = ::strata::get_logger_ref(logger_obj);                 \
    if (_logger.should_log(::strata::log_level::level)) {                 \
      ::strata::log_##level(_logger, std::source_location::current(), __VA_ARGS__); \
    }                                                                     \
  } while (0)

#define LOGGER_TRACE(obj, ...) LOGGER_CALL(obj, trace, __VA_ARGS__)
#define LOGGER_DEBUG(obj, ...) LOGGER_CALL(obj, debug, __VA_ARGS__)
#define LOGGER_INFO(obj, ...) LOGGER_CALL(obj, info, __VA_ARGS__)
#define LOGGER_WARN(obj, ...) LOGGER_CALL(obj, warn, __VA_ARGS__)
#define LOGGER_ERROR(obj, ...) LOGGER_CALL(obj, error, __VA_ARGS__)
#define LOGGER_CRITICAL(obj, ...) LOGGER_CALL(obj, critical, __VA_ARGS__)

void set_default_logger(std::shared_ptr<logger_interface> l);

logger_interface& default_logger();

std::shared_ptr<logger_interface> default_logger_ptr();

// ----------------------
// 全局宏定义 (无对象版)
// ----------------------
#define LOG_TRACE(...) LOGGER_TRACE(strata::default_logger(), __VA_ARGS__)
#define LOG_DEBUG(...) LOGGER_DEBUG(strata::default_logger(), __VA_ARGS__)
#define LOG_INFO(...) LOGGER_INFO(strata::default_logger(), __VA_ARGS__)
#define LOG_WARN(...) LOGGER_WARN(strata::default_logger(), __VA_ARGS__)
#define LOG_ERROR(...) LOGGER_ERROR(strata::default_logger(), __VA_ARGS__)
#define LOG_CRITICAL(...) LOGGER_CRITICAL(strata::default_logger(), __VA_ARGS__)

}  // namespace strata

#endif  // _STRATA_LOGGER_H_
